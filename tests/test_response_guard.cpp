#include <catch2/catch_test_macros.hpp>
#include "audit/audit_trail.hpp"
#include "audit/memory_audit_store.hpp"
#include "content/response_guard.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace llmshield;

namespace {

ResponseGuard default_guard() { return ResponseGuard(ResponseGuard::Config{}); }

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return utils::to_lower(haystack).find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// HTML
// ============================================================================

TEST_CASE("ResponseGuard: XSS corpus leaves nothing executable", "[response][html]") {
    const auto guard = default_guard();

    const std::vector<std::string> corpus = {
        "<script>alert(1)</script>",
        "<SCRIPT SRC=//evil.example/x.js></SCRIPT>",
        "<img src=x onerror=alert(1)>",
        "<svg onload=alert(1)>",
        R"(<a href="javascript:alert(1)">x</a>)",
        R"(<a href="JaVaScRiPt:alert(1)">x</a>)",
        R"(<a href=" javascript:alert(1)">x</a>)",
        R"(<a href="&#106;avascript:alert(1)">x</a>)",
        R"(<a href="java&#x09;script:alert(1)">x</a>)",
        R"(<a href="data:text/html;base64,PHNjcmlwdD4=">x</a>)",
        R"(<iframe src="javascript:alert(1)"></iframe>)",
        R"(<div style="background:url(javascript:alert(1))">x</div>)",
        "<body onload=alert(1)>",
        "<scr<script>ipt>alert(1)</script>",
        "<p>unclosed <script>alert(1)",
        "<math><mtext><table><mglyph><style><img src=x onerror=alert(1)>",
    };

    for (const auto& payload : corpus) {
        INFO(payload);
        const auto out = guard.sanitize_html(payload);
        CHECK_FALSE(contains_ci(out, "<script"));
        CHECK_FALSE(contains_ci(out, "onerror"));
        CHECK_FALSE(contains_ci(out, "onload"));
        CHECK_FALSE(contains_ci(out, "javascript:"));
        CHECK_FALSE(contains_ci(out, "<iframe"));
        CHECK_FALSE(contains_ci(out, "<img"));
    }
}

TEST_CASE("ResponseGuard: allowed markup survives, attributes do not", "[response][html]") {
    const auto guard = default_guard();

    CHECK(guard.sanitize_html("<p>Hello <strong>world</strong></p>") ==
          "<p>Hello <strong>world</strong></p>");
    CHECK(guard.sanitize_html(R"(<p class="x" style="color:red">t</p>)") == "<p>t</p>");
    CHECK(guard.sanitize_html("<ul><li>one</li><li>two</li></ul>") ==
          "<ul><li>one</li><li>two</li></ul>");
}

TEST_CASE("ResponseGuard: unknown elements are unwrapped, dangerous ones dropped", "[response][html]") {
    const auto guard = default_guard();
    ResponseGuard::FilterReport report;

    CHECK(guard.sanitize_html("<div><span>hi</span></div>", &report) == "hi");
    CHECK(report.elements_unwrapped == 2);

    CHECK(guard.sanitize_html(R"(<iframe src="https://evil.example"></iframe><p>x</p>)") == "<p>x</p>");
}

TEST_CASE("ResponseGuard: the report counts what was removed", "[response][html]") {
    const auto guard = default_guard();
    ResponseGuard::FilterReport report;

    const auto out = guard.sanitize_html(
        R"(<p onclick="steal()">Hello <script>alert(1)</script>world</p>)", &report);
    CHECK(out == "<p>Hello world</p>");
    CHECK(report.scripts_removed == 1);
    CHECK(report.handlers_removed == 1);
}

TEST_CASE("ResponseGuard: text content is entity-encoded", "[response][html]") {
    const auto guard = default_guard();
    CHECK(guard.sanitize_html("<p>1 &lt; 2 &amp; \"q\"</p>") == "<p>1 &lt; 2 &amp; &quot;q&quot;</p>");
}

TEST_CASE("ResponseGuard: links", "[response][html][links]") {
    SECTION("external links open safely") {
        const auto guard = default_guard();
        CHECK(guard.sanitize_html(R"(<a href="https://example.com/a">x</a>)") ==
              R"(<a href="https://example.com/a" rel="noopener noreferrer nofollow" target="_blank">x</a>)");
    }
    SECTION("same-site links are left alone") {
        ResponseGuard::Config cfg;
        cfg.site_host = "Example.com";
        const ResponseGuard guard(cfg);
        CHECK(guard.sanitize_html(R"(<a href="https://EXAMPLE.com/docs" title="Docs">d</a>)") ==
              R"(<a href="https://EXAMPLE.com/docs" title="Docs">d</a>)");
    }
    SECTION("invalid targets are flagged") {
        const auto guard = default_guard();
        ResponseGuard::FilterReport report;
        CHECK(guard.sanitize_html(R"(<a href="ftp://files.example.com/f">f</a>)", &report) ==
              R"(<a data-invalid-url="true">f</a>)");
        CHECK(report.invalid_links == 1);
    }
    SECTION("links can be disabled") {
        ResponseGuard::Config cfg;
        cfg.allow_links = false;
        const ResponseGuard guard(cfg);
        CHECK(guard.sanitize_html(R"(<a href="https://example.com">x</a>)") == "x");
    }
    SECTION("without URL validation only script schemes are refused") {
        ResponseGuard::Config cfg;
        cfg.validate_urls = false;
        const ResponseGuard guard(cfg);
        CHECK(guard.sanitize_html(R"(<a href="ftp://files.example.com">f</a>)") ==
              R"(<a href="ftp://files.example.com">f</a>)");
    }
}

TEST_CASE("ResponseGuard: code blocks are isolated", "[response][html][code]") {
    const std::string html = R"(<pre><code class="language-cpp">int a = 1 &lt; 2;</code></pre>)";

    SECTION("wrapped by default") {
        CHECK(default_guard().sanitize_html(html) ==
              R"(<div class="llm-code-block"><pre><code class="language-cpp">int a = 1 &lt; 2;</code></pre></div>)");
    }
    SECTION("isolation off") {
        ResponseGuard::Config cfg;
        cfg.isolate_code_blocks = false;
        CHECK(ResponseGuard(cfg).sanitize_html(html) ==
              R"(<pre><code class="language-cpp">int a = 1 &lt; 2;</code></pre>)");
    }
}

TEST_CASE("ResponseGuard: HTML disabled means entity encoding", "[response][html]") {
    ResponseGuard::Config cfg;
    cfg.allow_html = false;
    const ResponseGuard guard(cfg);
    CHECK(guard.sanitize_html("<script>x</script>") == "&lt;script&gt;x&lt;/script&gt;");
}

// ============================================================================
// Markdown / plain
// ============================================================================

TEST_CASE("ResponseGuard: markdown links are validated", "[response][markdown]") {
    const auto guard = default_guard();

    CHECK(guard.sanitize_markdown("[docs](https://example.com) and [bad](ftp://evil.example/a)") ==
          "[docs](https://example.com) and bad");
    CHECK(guard.sanitize_markdown("**bold** and `code`") == "**bold** and `code`");

    const auto with_ref = guard.sanitize_markdown("See [1].\n[1]: ftp://evil.example/f\n");
    CHECK(with_ref.find("ftp://") == std::string::npos);
    CHECK(with_ref.find("See [1].") == 0);

    const auto scripted = guard.sanitize_markdown("hi <script>alert(1)</script>there");
    CHECK(scripted == "hi there");
}

TEST_CASE("ResponseGuard: inline HTML in markdown leaves nothing executable", "[response][markdown]") {
    const auto guard = default_guard();

    const std::vector<std::string> corpus = {
        "<script>alert(1)</script>",
        "<img src=x onerror=alert(1)>",
        "<img/src=x/onerror=alert(1)>",
        "<svg/onload=alert(1)>",
        R"(<a href="jav&#x61;script:alert(1)">x</a>)",
        R"(<a href="&#106;avascript:alert(1)">x</a>)",
        R"(<iframe src="https://evil.example/"></iframe>)",
        "<math><mtext><table><mglyph><style><img src=x onerror=alert(1)>",
        "Some text then <img src=x onerror=alert(1)> inline",
        "- item with <iframe src=x></iframe>",
        "> quoted <img src=x>",
        "[click](javascript:alert(1))",
        "`code` and <svg onload=alert(1)>",
    };

    for (const auto& payload : corpus) {
        INFO(payload);
        const auto out = guard.sanitize_markdown(payload);
        CHECK_FALSE(contains_ci(out, "<script"));
        CHECK_FALSE(contains_ci(out, "onerror"));
        CHECK_FALSE(contains_ci(out, "onload"));
        CHECK_FALSE(contains_ci(out, "javascript:"));
        CHECK_FALSE(contains_ci(out, "<iframe"));
        CHECK_FALSE(contains_ci(out, "<img"));
        CHECK_FALSE(contains_ci(out, "<svg"));
    }
}

TEST_CASE("ResponseGuard: markdown code stays literal", "[response][markdown][code]") {
    const auto guard = default_guard();

    SECTION("code spans are not parsed as HTML") {
        CHECK(guard.sanitize_markdown("Use `<div>` here and <b>bold</b>") == "Use `<div>` here and bold");
        CHECK(guard.sanitize_markdown("Wrap it in `<span>`.") == "Wrap it in `<span>`.");
    }
    SECTION("fenced blocks pass unchanged") {
        const std::string fenced = "Example:\n\n```html\n<div class=\"box\">hi</div>\n```\n";
        CHECK(guard.sanitize_markdown(fenced) == fenced);
    }
    SECTION("a fence inside a raw HTML block is filtered") {
        const auto out = guard.sanitize_markdown("<div>\n```\n<img src=x>\n```\n</div>\n");
        CHECK_FALSE(contains_ci(out, "<img"));
        CHECK(out.find("```") != std::string::npos);
    }
    SECTION("safe autolinks are kept") {
        CHECK(guard.sanitize_markdown("See <https://example.com/docs> now") ==
              "See <https://example.com/docs> now");
        CHECK(guard.sanitize_markdown("Mail <team@example.com>") == "Mail <team@example.com>");
    }
}

TEST_CASE("ResponseGuard: long script bodies are removed", "[response][long]") {
    const auto guard = default_guard();
    const std::string body(90000, 'x');

    CHECK(guard.sanitize_response("<p>a</p><script>" + body + "</script>", ResponseFormat::HTML) ==
          "<p>a</p>");
    CHECK(guard.sanitize_response("a<script>" + body + "</script>b", ResponseFormat::MARKDOWN) == "ab");
}

TEST_CASE("ResponseGuard: markdown without HTML or links", "[response][markdown]") {
    SECTION("tags stripped, stray brackets escaped") {
        ResponseGuard::Config cfg;
        cfg.allow_html = false;
        CHECK(ResponseGuard(cfg).sanitize_markdown("**bold** <b>tag</b> 1 < 2") ==
              "**bold** tag 1 &lt; 2");
    }
    SECTION("links reduced to their text") {
        ResponseGuard::Config cfg;
        cfg.allow_links = false;
        CHECK(ResponseGuard(cfg).sanitize_markdown("[docs](https://example.com)") == "docs");
    }
    SECTION("markdown disabled") {
        ResponseGuard::Config cfg;
        cfg.allow_markdown = false;
        CHECK(ResponseGuard(cfg).sanitize_markdown("<b>x</b>") == "&lt;b&gt;x&lt;/b&gt;");
    }
}

TEST_CASE("ResponseGuard: plain text and unknown formats are escaped", "[response][plain]") {
    const auto guard = default_guard();
    CHECK(ResponseGuard::sanitize_text(R"(<b>"x" & 'y'</b>)") ==
          "&lt;b&gt;&quot;x&quot; &amp; &#039;y&#039;&lt;/b&gt;");
    CHECK(guard.sanitize_response("<i>hi</i>", parse_response_format("xml")) == "&lt;i&gt;hi&lt;/i&gt;");
    CHECK(parse_response_format("md") == ResponseFormat::MARKDOWN);
    CHECK(parse_response_format("html") == ResponseFormat::HTML);
}

TEST_CASE("ResponseGuard: over-long output is truncated with a marker", "[response]") {
    ResponseGuard::Config cfg;
    cfg.max_response_length = 10;
    const ResponseGuard guard(cfg);

    const auto out = guard.sanitize_response("abcdefghijklmnop", ResponseFormat::PLAIN);
    CHECK(out == "abcdefghij\n[Output truncated]");
    CHECK(guard.sanitize_response("short", ResponseFormat::PLAIN) == "short");

    cfg.max_response_length = 0;
    CHECK_THROWS_AS(ResponseGuard(cfg), ConfigurationValidationError);
}

// ============================================================================
// Audit
// ============================================================================

TEST_CASE("ResponseGuard: script content in a response is audited", "[response][audit]") {
    auto store = std::make_shared<MemoryAuditStore>();
    auto audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, store);
    const ResponseGuard guard(ResponseGuard::Config{}, audit);

    CHECK(guard.sanitize_response("<p>ok</p>", ResponseFormat::HTML) == "<p>ok</p>");
    CHECK(store->query(AuditFilter{}, 10, 0).empty());

    CHECK(guard.sanitize_response("<p>hi</p><script>alert(1)</script>", ResponseFormat::HTML) ==
          "<p>hi</p>");

    const auto events = store->query(AuditFilter{}, 10, 0);
    REQUIRE(events.size() == 1);
    CHECK(events[0].event_type == AuditEventType::SUSPICIOUS_ACTIVITY);
    CHECK(events[0].details["activity_type"].get<std::string>() == "response_script_content");
    CHECK(events[0].details["scripts_removed"].get<int>() == 1);
}

TEST_CASE("ResponseGuard: script content in markdown is audited", "[response][audit][markdown]") {
    auto store = std::make_shared<MemoryAuditStore>();
    auto audit = std::make_shared<AuditTrail>(AuditTrail::Config{}, store);
    const ResponseGuard guard(ResponseGuard::Config{}, audit);

    CHECK(guard.sanitize_response("hi <script>alert(1)</script>there", ResponseFormat::MARKDOWN) ==
          "hi there");

    const auto events = store->query(AuditFilter{}, 10, 0);
    REQUIRE(events.size() == 1);
    CHECK(events[0].details["activity_type"].get<std::string>() == "response_script_content");
    CHECK(events[0].details["format"].get<std::string>() == "markdown");
    CHECK(events[0].details["scripts_removed"].get<int>() == 1);
}

// ============================================================================
// Structured output / URLs
// ============================================================================

TEST_CASE("ResponseGuard: structured output is escaped recursively", "[response][json]") {
    const auto input = JsonValue::parse(R"({"a":"<b>x</b>","n":[1,"it's"],"ok":true})");
    const auto out = ResponseGuard::sanitize_structured_output(input);

    CHECK(out["a"].get<std::string>() == "&lt;b&gt;x&lt;/b&gt;");
    CHECK(out["n"][size_t{0}].get<int>() == 1);
    CHECK(out["n"][size_t{1}].get<std::string>() == "it&#039;s");
    CHECK(out["ok"].get<bool>());
}

TEST_CASE("ResponseGuard: external URL classification", "[response][links]") {
    ResponseGuard::Config cfg;
    cfg.site_host = "Example.com";
    const ResponseGuard guard(cfg);

    CHECK_FALSE(guard.is_external_url("https://EXAMPLE.com/a"));
    CHECK(guard.is_external_url("https://other.org/"));
    CHECK_FALSE(guard.is_external_url("mailto:x@example.com"));

    CHECK(default_guard().is_external_url("https://example.com"));
    CHECK(ResponseGuard::is_safe_url("mailto:x@example.com"));
    CHECK_FALSE(ResponseGuard::is_safe_url("javascript:void(0)"));
}
