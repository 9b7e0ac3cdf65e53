#include <collab/collab.hpp>
#include <collab/mcp/handler.hpp>
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace collab;

namespace fs = std::filesystem;

static ScanResult scan_text(const std::string& language, const std::string& content) {
    return scan("test." + language, language, content);
}

static size_t count_kind(const Diagnostics& diagnostics, DiagnosticKind kind) {
    size_t n = 0;
    for (const auto& d : diagnostics) {
        if (d.kind == kind) ++n;
    }
    return n;
}

// Raw trust text at a position; nullopt when not covered
static std::optional<std::string> trust_at(const ScanResult& result, size_t line, size_t column) {
    RegionIndex index(result.regions);
    auto attrs = index.query(line, column);
    if (!attrs) return std::nullopt;
    return attrs->get("trust");
}

static std::string temp_dir() {
    auto dir = fs::temp_directory_path() / ("collab_test_" + std::to_string(getpid()));
    fs::create_directories(dir);
    return dir.string();
}

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// ═══════════════════════════════════════════════════════════════════════════
// Source text and comments
// ═══════════════════════════════════════════════════════════════════════════

void test_source_text() {
    std::cout << "Testing SourceText..." << std::endl;

    std::string content = "ab\r\n\tcd\n\nx";
    SourceText src(content);
    assert(src.line_count() == 4);
    assert(src.line(1) == "ab");
    assert(src.line(2) == "\tcd");
    assert(src.line(4) == "x");
    assert(src.indentation(2) == 8);
    assert(src.first_code_column(2) == 2);
    assert(src.is_blank(3));
    assert(src.position_of(4) == (Position{2, 1}));
    assert(src.offset_of({2, 2}) == 5);
    assert(src.end_of_line(1) == (Position{1, 3}));

    std::cout << "  PASS" << std::endl;
}

void test_comment_extractor() {
    std::cout << "Testing CommentExtractor..." << std::endl;

    std::string cpp =
        "int a = 1; // one\n"
        "const char* s = \"// not a comment\";\n"
        "char q = '\"'; /* two */\n"
        "/* three\n"
        "   lines */\n";
    SourceText src(cpp);
    auto comments = CommentExtractor(src, *find_language("cpp")).collect();
    assert(comments.size() == 3);
    assert(comments[0].style == CommentStyle::Line);
    assert(comments[0].text == " one");
    assert(comments[0].span.start == (Position{1, 12}));
    assert(comments[0].trailing);
    assert(comments[1].style == CommentStyle::Block);
    assert(comments[1].span.start == (Position{3, 15}));
    assert(comments[2].span.start == (Position{4, 1}));
    assert(comments[2].span.end == (Position{5, 12}));
    assert(!comments[2].trailing);

    // Lifetimes are not char literals
    std::string rust = "fn f<'a>(x: &'a str) -> &'a str { x } // c\n";
    SourceText rsrc(rust);
    assert(CommentExtractor(rsrc, *find_language("rust")).collect().size() == 1);

    // '#' inside a triple-quoted string
    std::string py = "x = \"\"\" # no \"\"\"\n# yes\n";
    SourceText psrc(py);
    auto pyc = CommentExtractor(psrc, *find_language("python")).collect();
    assert(pyc.size() == 1);
    assert(pyc[0].span.start.line == 2);

    // Cursor restarts from the top
    CommentCursor cursor(src, *find_language("cpp"));
    assert(cursor.next().has_value());
    cursor.reset();
    auto again = cursor.next();
    assert(again && again->text == " one");

    std::cout << "  PASS" << std::endl;
}

void test_language_resolver() {
    std::cout << "Testing LanguageResolver..." << std::endl;

    LanguageResolver resolver;
    assert(resolver.resolve("a/b/c.PY") == "python");
    assert(resolver.resolve("src/view.tsx") == "typescript");
    assert(resolver.resolve("lib\\core.rs") == "rust");
    assert(resolver.resolve("Makefile").empty());
    assert(resolver.resolve("tool.pyw").empty());
    resolver.map_extension(".pyw", "python");
    assert(resolver.resolve("tool.pyw") == "python");

    assert(find_language("python")->style == ScopeStyle::Indentation);
    assert(find_language("go")->style == ScopeStyle::Brace);
    assert(find_language("shell")->style == ScopeStyle::ExplicitMarkerOnly);
    assert(find_language("cobol") == nullptr);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Directive parsing
// ═══════════════════════════════════════════════════════════════════════════

void test_parse_attributes() {
    std::cout << "Testing parse_attributes..." << std::endl;

    auto ok = parse_attributes(R"( trust="READ_ONLY" owner='team' constraints=["a", 'b', c] intent=bare)");
    assert(ok.ok);
    assert(std::get<std::string>(ok.attributes["trust"]) == "READ_ONLY");
    assert(std::get<std::string>(ok.attributes["owner"]) == "team");
    assert(std::get<std::string>(ok.attributes["intent"]) == "bare");
    auto list = std::get<std::vector<std::string>>(ok.attributes["constraints"]);
    assert((list == std::vector<std::string>{"a", "b", "c"}));

    auto escaped = parse_attributes(R"(intent="say \"hi\"")");
    assert(escaped.ok);
    assert(std::get<std::string>(escaped.attributes["intent"]) == "say \"hi\"");

    auto dup = parse_attributes(R"(trust="READ_ONLY" trust="AUTONOMOUS")");
    assert(dup.ok && std::get<std::string>(dup.attributes["trust"]) == "AUTONOMOUS");

    assert(!parse_attributes(R"(trust="READ_ONLY)").ok);
    assert(!parse_attributes("trust").ok);
    assert(!parse_attributes(R"(constraints=["a")").ok);
    assert(!parse_attributes(R"(trust="A"owner="b")").ok);
    assert(parse_attributes("").ok);

    std::cout << "  PASS" << std::endl;
}

void test_merge_law() {
    std::cout << "Testing merge of consecutive directives..." << std::endl;

    auto r = scan_text("rust",
        "// @collab trust=\"SUGGEST_ONLY\"\n"
        "// @collab owner=\"x\"\n"
        "fn f() {\n"
        "}\n");
    assert(r.diagnostics.empty());
    assert(r.directives.size() == 1);
    assert(r.directives[0].form == DirectiveForm::MultiLineMerged);
    assert(r.regions.size() == 1);
    assert(attribute_text(r.regions[0].effective.at("trust")) == "SUGGEST_ONLY");
    assert(attribute_text(r.regions[0].effective.at("owner")) == "x");

    auto last = scan_text("rust",
        "// @collab trust=\"AUTONOMOUS\"\n"
        "// @collab trust=\"READ_ONLY\"\n"
        "fn f() {}\n");
    assert(last.regions.size() == 1);
    assert(trust_at(last, 3, 1) == std::optional<std::string>("READ_ONLY"));

    // A blank line splits the run
    auto split = scan_text("rust",
        "// @collab trust=\"AUTONOMOUS\"\n"
        "\n"
        "// @collab owner=\"y\"\n"
        "fn f() {}\n");
    assert(split.directives.size() == 2);
    assert(split.directives[0].form == DirectiveForm::SingleLine);

    std::cout << "  PASS" << std::endl;
}

void test_block_comment_directive() {
    std::cout << "Testing directive in a doc block comment..." << std::endl;

    auto r = scan_text("c",
        "/**\n"
        " * @collab trust=\"READ_ONLY\"\n"
        " *         owner=\"kernel\"\n"
        " */\n"
        "int f(void) {\n"
        "    return 0;\n"
        "}\n");
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 1);
    assert(r.regions[0].scope.start == (Position{5, 1}));
    assert(r.regions[0].scope.end == (Position{7, 2}));
    assert(attribute_text(r.regions[0].effective.at("owner")) == "kernel");

    std::cout << "  PASS" << std::endl;
}

void test_syntax_error_continues() {
    std::cout << "Testing syntax errors do not stop the scan..." << std::endl;

    auto r = scan_text("rust",
        "// @collab trust=\"READ_ONLY\n"
        "fn a() {}\n"
        "\n"
        "// @collab owner=\n"
        "fn b() {}\n"
        "\n"
        "// @collab trust=\"AUTONOMOUS\"\n"
        "fn c() {}\n"
        "// @collab:start\n");
    assert(count_kind(r.diagnostics, DiagnosticKind::DirectiveSyntax) == 3);
    assert(r.diagnostics[0].position == (Position{1, 1}));
    assert(r.diagnostics[0].text == "// @collab trust=\"READ_ONLY");
    assert(r.regions.size() == 1);
    assert(!trust_at(r, 2, 1));
    assert(trust_at(r, 8, 1) == std::optional<std::string>("AUTONOMOUS"));

    // Prose mentioning the marker is an ordinary comment
    auto prose = scan_text("ruby", "# @collab system for trust level management.\nputs 1\n");
    assert(prose.diagnostics.empty());
    assert(prose.directives.empty());

    // A known key without '=' is a malformed directive, not prose
    auto spaced = scan_text("rust", "// @collab trust READ_ONLY\nfn f() {}\n");
    assert(count_kind(spaced.diagnostics, DiagnosticKind::DirectiveSyntax) == 1);
    assert(spaced.diagnostics[0].message.find("missing '='") != std::string::npos);
    assert(spaced.regions.empty());

    std::cout << "  PASS" << std::endl;
}

void test_unknown_trust() {
    std::cout << "Testing unknown trust value..." << std::endl;

    auto r = scan_text("rust", "// @collab trust=\"MAYBE\" owner=\"x\"\nfn f() {}\n");
    assert(count_kind(r.diagnostics, DiagnosticKind::InvalidTrustValue) == 1);
    assert(r.diagnostics[0].text == "MAYBE");
    assert(r.regions.size() == 1);

    RegionIndex index(r.regions);
    auto attrs = index.query(2, 1);
    assert(attrs);
    assert(attrs->get("trust") == std::optional<std::string>("MAYBE"));
    assert(!attrs->trust());
    assert(attrs->owner() == std::optional<std::string>("x"));

    // Not usable by the trust lookup either
    auto result = check_trust(TrustConfig{}, "f.rs", &index, LineRange{2, 2});
    assert(result.source == TrustSource::Default);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Blocks
// ═══════════════════════════════════════════════════════════════════════════

void test_unbalanced_block() {
    std::cout << "Testing unbalanced blocks..." << std::endl;

    auto open = scan_text("rust", "// @collab:begin trust=\"READ_ONLY\"\nfn f() {}\n");
    assert(count_kind(open.diagnostics, DiagnosticKind::UnbalancedBlock) == 1);
    assert(open.diagnostics[0].position == (Position{3, 1}));
    assert(open.diagnostics[0].related && open.diagnostics[0].related->line == 1);
    assert(open.regions.empty());

    auto stray = scan_text("rust", "fn f() {}\n// @collab:end\n");
    assert(count_kind(stray.diagnostics, DiagnosticKind::UnbalancedBlock) == 1);
    assert(stray.diagnostics[0].position == (Position{2, 1}));
    assert(stray.regions.empty());

    // Directives before the imbalance survive
    auto mixed = scan_text("rust",
        "// @collab trust=\"AUTONOMOUS\"\n"
        "fn a() {}\n"
        "// @collab:begin trust=\"READ_ONLY\"\n"
        "fn b() {}\n");
    assert(mixed.regions.size() == 1);
    assert(trust_at(mixed, 2, 1) == std::optional<std::string>("AUTONOMOUS"));
    assert(!trust_at(mixed, 4, 1));

    std::cout << "  PASS" << std::endl;
}

void test_nested_blocks() {
    std::cout << "Testing nested blocks..." << std::endl;

    std::string content =
        "// @collab:begin trust=\"SUPERVISED\" owner=\"platform\"\n"
        "// @collab:begin trust=\"READ_ONLY\"\n"
        "fn a() {}\n"
        "// @collab:end\n"
        "fn b() {}\n"
        "// @collab:end\n";
    auto r = scan_text("rust", content);
    SourceText src(content);
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 2);
    assert(r.regions[0].scope.start == src.end_of_line(1));
    assert(r.regions[0].scope.end == (Position{6, 1}));
    assert(r.regions[1].parent == std::optional<size_t>(0));
    assert(r.regions[1].depth == 1);
    assert(r.regions[1].provenance.size() == 2);
    assert(r.regions[1].provenance[0].ordinal == 0);
    assert(r.regions[1].provenance[1].ordinal == 1);

    RegionIndex index(r.regions);
    auto inner = index.query(3, 1);
    assert(inner && inner->trust() == TrustLevel::ReadOnly);
    assert(inner->owner() == std::optional<std::string>("platform"));
    auto outer = index.query(5, 1);
    assert(outer && outer->trust() == TrustLevel::Supervised);
    assert(index.roots().size() == 1 && index.roots()[0] == 0);
    assert(index.children(0).size() == 1 && index.children(0)[0] == 1);
    assert(index.children(1).empty());

    std::cout << "  PASS" << std::endl;
}

void test_nesting_override() {
    std::cout << "Testing inner annotation overrides enclosing block..." << std::endl;

    auto r = scan_text("typescript",
        "// @collab:begin trust=\"SUPERVISED\"\n"
        "class Service {\n"
        "  // @collab trust=\"SUGGEST_ONLY\"\n"
        "  method() {\n"
        "    return 1;\n"
        "  }\n"
        "\n"
        "  other() {\n"
        "    return 2;\n"
        "  }\n"
        "}\n"
        "// @collab:end\n");
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 2);
    assert(r.regions[1].scope.start == (Position{4, 3}));
    assert(r.regions[1].scope.end == (Position{6, 4}));

    assert(trust_at(r, 5, 5) == std::optional<std::string>("SUGGEST_ONLY"));
    assert(trust_at(r, 9, 5) == std::optional<std::string>("SUPERVISED"));
    assert(trust_at(r, 4, 1) == std::optional<std::string>("SUPERVISED"));
    assert(!trust_at(r, 12, 1));

    std::cout << "  PASS" << std::endl;
}

void test_explicit_marker_language() {
    std::cout << "Testing explicit-marker language..." << std::endl;

    std::string content =
        "# @collab:begin trust=\"READ_ONLY\"\n"
        "rm -rf build\n"
        "# @collab:end\n"
        "echo done # @collab owner=\"ops\"\n";
    auto r = scan_text("shell", content);
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 2);
    assert(trust_at(r, 2, 1) == std::optional<std::string>("READ_ONLY"));

    RegionIndex index(r.regions);
    auto tail = index.query(4, 1);
    assert(tail && tail->owner() == std::optional<std::string>("ops"));
    assert(tail->scope().end == SourceText(content).end_of_line(4));

    // A single-line directive in a shell script covers its own line only
    auto own = scan_text("shell", "# @collab trust=\"AUTONOMOUS\"\nmake all\n");
    assert(own.regions.size() == 1);
    assert(own.regions[0].kind == ScopeKind::OwnLine);
    assert(!trust_at(own, 2, 1));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scope detection
// ═══════════════════════════════════════════════════════════════════════════

void test_brace_end_to_end() {
    std::cout << "Testing brace scope end to end..." << std::endl;

    auto r = scan_text("rust",
        "use std::io;\n"
        "\n"
        "// @collab trust=\"READ_ONLY\"\n"
        "fn f() {\n"
        "    let s = \"}\";\n"
        "    g();\n"
        "}\n"
        "\n"
        "fn h() {}\n");
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 1);
    assert(r.regions[0].kind == ScopeKind::Declaration);
    assert(r.regions[0].scope.start == (Position{4, 1}));
    assert(r.regions[0].scope.end == (Position{7, 2}));
    assert(trust_at(r, 6, 5) == std::optional<std::string>("READ_ONLY"));
    assert(!trust_at(r, 9, 1));
    assert(!trust_at(r, 3, 1));

    // Raw strings with braces
    auto go = scan_text("go",
        "package main\n"
        "\n"
        "// @collab trust=\"READ_ONLY\"\n"
        "func q() string {\n"
        "\treturn `}{`\n"
        "}\n");
    assert(go.regions.size() == 1);
    assert(go.regions[0].scope.end == (Position{6, 2}));

    // A statement without a body ends at ';'
    auto stmt = scan_text("java",
        "class A {\n"
        "    // @collab trust=\"READ_ONLY\" intent=\"wire format\"\n"
        "    static final int VERSION = 3;\n"
        "    int other;\n"
        "}\n");
    assert(stmt.regions.size() == 1);
    assert(stmt.regions[0].scope.start == (Position{3, 5}));
    assert(stmt.regions[0].scope.end == (Position{3, 34}));

    std::cout << "  PASS" << std::endl;
}

void test_brace_fallbacks() {
    std::cout << "Testing brace scope fallbacks..." << std::endl;

    // No closing brace
    std::string unclosed = "// @collab trust=\"READ_ONLY\"\nfn f() {\n    g();\n";
    auto r = scan_text("rust", unclosed);
    assert(count_kind(r.diagnostics, DiagnosticKind::ScopeDetection) == 1);
    assert(r.regions.size() == 1);
    assert(r.regions[0].kind == ScopeKind::OwnLine);
    assert(r.regions[0].scope.start == (Position{1, 1}));
    assert(r.regions[0].scope.end == SourceText(unclosed).end_of_line(1));

    // Trailing directive governs its own line
    auto trailing = scan_text("rust", "let x = 1; // @collab trust=\"AUTONOMOUS\"\nlet y = 2;\n");
    assert(trailing.regions.size() == 1);
    assert(trust_at(trailing, 1, 5) == std::optional<std::string>("AUTONOMOUS"));
    assert(!trust_at(trailing, 2, 5));

    // Nothing declared before the enclosing block closes
    auto last = scan_text("rust", "fn f() {\n    g();\n    // @collab trust=\"READ_ONLY\"\n}\n");
    assert(last.diagnostics.empty());
    assert(last.regions.size() == 1);
    assert(last.regions[0].kind == ScopeKind::OwnLine);
    assert(last.regions[0].scope.start == (Position{3, 5}));

    // A trailing directive after a closing brace leaves the function intact
    auto closer = scan_text("rust",
        "// @collab trust=\"READ_ONLY\"\n"
        "fn f() {\n"
        "    g();\n"
        "} // @collab owner=\"z\"\n"
        "fn h() {}\n");
    assert(closer.diagnostics.empty());
    assert(closer.regions.size() == 2);
    assert(closer.regions[1].scope.start == (Position{4, 3}));
    assert(closer.regions[1].scope.end == (Position{4, 23}));
    assert(trust_at(closer, 3, 5) == std::optional<std::string>("READ_ONLY"));
    RegionIndex closer_index(closer.regions);
    auto note = closer_index.query(4, 10);
    assert(note && note->owner() == std::optional<std::string>("z"));
    assert(!note->trust());

    std::cout << "  PASS" << std::endl;
}

void test_newline_terminated_declarations() {
    std::cout << "Testing declarations ended by a line break..." << std::endl;

    auto ts = scan_text("typescript",
        "// @collab trust=\"READ_ONLY\"\n"
        "const LIMIT = 10\n"
        "function g() {\n"
        "  return LIMIT\n"
        "}\n");
    assert(ts.diagnostics.empty());
    assert(ts.regions.size() == 1);
    assert(ts.regions[0].scope.end == (Position{2, 17}));
    assert(trust_at(ts, 2, 7) == std::optional<std::string>("READ_ONLY"));
    assert(!trust_at(ts, 4, 3));

    // An operator at the end of the line carries the statement on
    auto arrow = scan_text("typescript",
        "// @collab trust=\"READ_ONLY\"\n"
        "const handler = (x: number) =>\n"
        "  x + 1\n"
        "function g() {}\n");
    assert(arrow.regions.size() == 1);
    assert(arrow.regions[0].scope.end == (Position{3, 8}));
    assert(!trust_at(arrow, 4, 1));

    auto go = scan_text("go",
        "package main\n"
        "// @collab trust=\"READ_ONLY\"\n"
        "type ID string\n"
        "func g() {}\n");
    assert(go.regions.size() == 1);
    assert(go.regions[0].scope.start == (Position{3, 1}));
    assert(go.regions[0].scope.end == (Position{3, 15}));
    assert(!trust_at(go, 4, 1));

    // Annotation lines lead the declaration they decorate
    auto kotlin = scan_text("kotlin",
        "// @collab trust=\"READ_ONLY\"\n"
        "@Serializable\n"
        "data class Point(val x: Int)\n"
        "fun g() {}\n");
    assert(kotlin.regions.size() == 1);
    assert(kotlin.regions[0].scope.start == (Position{2, 1}));
    assert(kotlin.regions[0].scope.end == (Position{3, 29}));
    assert(!trust_at(kotlin, 4, 1));

    std::cout << "  PASS" << std::endl;
}

void test_python_indentation() {
    std::cout << "Testing indentation scope (python)..." << std::endl;

    auto r = scan_text("python",
        "import os\n"
        "\n"
        "# @collab trust=\"READ_ONLY\" owner=\"security\"\n"
        "def check(token):\n"
        "    if not token:\n"
        "        return False\n"
        "\n"
        "    return True\n"
        "\n"
        "def other():\n"
        "    pass\n");
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 1);
    assert(r.regions[0].scope.start == (Position{4, 1}));
    assert(r.regions[0].scope.end == (Position{8, 16}));
    assert(trust_at(r, 6, 9) == std::optional<std::string>("READ_ONLY"));
    assert(trust_at(r, 8, 5) == std::optional<std::string>("READ_ONLY"));
    assert(!trust_at(r, 10, 1));
    assert(!trust_at(r, 11, 5));

    auto nested = scan_text("python",
        "# @collab trust=\"SUPERVISED\"\n"
        "class Store:\n"
        "    # @collab trust=\"READ_ONLY\"\n"
        "    def save(self):\n"
        "        write()\n"
        "\n"
        "    def load(self):\n"
        "        read()\n");
    assert(nested.regions.size() == 2);
    assert(nested.regions[0].scope.end == (Position{8, 15}));
    assert(nested.regions[1].scope.start == (Position{4, 5}));
    assert(nested.regions[1].scope.end == (Position{5, 16}));
    assert(trust_at(nested, 5, 9) == std::optional<std::string>("READ_ONLY"));
    assert(trust_at(nested, 8, 9) == std::optional<std::string>("SUPERVISED"));

    auto decorated = scan_text("python",
        "# @collab trust=\"AUTONOMOUS\"\n"
        "@cached\n"
        "def f():\n"
        "    return 1\n"
        "g = 2\n");
    assert(decorated.regions.size() == 1);
    assert(decorated.regions[0].scope.start == (Position{2, 1}));
    assert(trust_at(decorated, 4, 5) == std::optional<std::string>("AUTONOMOUS"));
    assert(!trust_at(decorated, 5, 1));

    // Continuation lines of a bracketed expression belong to the statement
    auto call = scan_text("python",
        "# @collab trust=\"READ_ONLY\"\n"
        "LIMITS = dict(\n"
        "  a=1,\n"
        ")\n"
        "other = 1\n");
    assert(call.regions.size() == 1);
    assert(call.regions[0].scope.end.line == 4);

    std::cout << "  PASS" << std::endl;
}

void test_ruby_indentation() {
    std::cout << "Testing indentation scope (ruby)..." << std::endl;

    auto r = scan_text("ruby",
        "# @collab trust=\"SUGGEST_ONLY\"\n"
        "def charge(amount)\n"
        "  gateway.call(amount)\n"
        "end\n"
        "\n"
        "def refund\n"
        "end\n");
    assert(r.diagnostics.empty());
    assert(r.regions.size() == 1);
    assert(r.regions[0].scope.end == (Position{4, 4}));
    assert(trust_at(r, 3, 3) == std::optional<std::string>("SUGGEST_ONLY"));
    assert(trust_at(r, 4, 1) == std::optional<std::string>("SUGGEST_ONLY"));
    assert(!trust_at(r, 6, 1));

    // Method-level rescue / ensure stay inside the method
    auto rescued = scan_text("ruby",
        "# @collab trust=\"READ_ONLY\"\n"
        "def verify(payload, signature)\n"
        "  hmac.check(payload, signature)\n"
        "rescue KeyError\n"
        "  false\n"
        "ensure\n"
        "  log.flush\n"
        "end\n"
        "\n"
        "def other\n"
        "end\n");
    assert(rescued.diagnostics.empty());
    assert(rescued.regions.size() == 1);
    assert(rescued.regions[0].kind == ScopeKind::Declaration);
    assert(rescued.regions[0].scope.end == (Position{8, 4}));
    assert(trust_at(rescued, 3, 3) == std::optional<std::string>("READ_ONLY"));
    assert(trust_at(rescued, 5, 3) == std::optional<std::string>("READ_ONLY"));
    assert(!trust_at(rescued, 10, 1));

    auto broken = scan_text("ruby", "# @collab trust=\"READ_ONLY\"\ndef broken\n  x = 1\n");
    assert(count_kind(broken.diagnostics, DiagnosticKind::ScopeDetection) == 1);
    assert(broken.regions.size() == 1);
    assert(broken.regions[0].kind == ScopeKind::OwnLine);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Precedence
// ═══════════════════════════════════════════════════════════════════════════

void test_overlap_not_nested() {
    std::cout << "Testing overlapping scopes are refused..." << std::endl;

    auto r = scan_text("rust",
        "// @collab trust=\"READ_ONLY\"\n"
        "fn f() {\n"
        "    // @collab:begin trust=\"AUTONOMOUS\"\n"
        "    a();\n"
        "}\n"
        "b();\n"
        "// @collab:end\n");
    assert(count_kind(r.diagnostics, DiagnosticKind::OverlapNotNested) == 1);
    assert(r.regions.empty());
    assert(!trust_at(r, 4, 5));
    assert(!trust_at(r, 6, 1));

    std::cout << "  PASS" << std::endl;
}

void test_identical_scope_tie_break() {
    std::cout << "Testing tie-break for identical scopes..." << std::endl;

    // Same form: the later directive wins
    auto r = scan_text("rust",
        "// @collab trust=\"READ_ONLY\"\n"
        "// plain note\n"
        "// @collab trust=\"AUTONOMOUS\" owner=\"b\"\n"
        "fn f() {}\n");
    assert(r.regions.size() == 2);
    assert(r.regions[0].scope == r.regions[1].scope);
    assert(r.regions[1].provenance.size() == 2);
    RegionIndex index(r.regions);
    auto attrs = index.query(4, 1);
    assert(attrs && attrs->trust() == TrustLevel::Autonomous);
    assert(attrs->owner() == std::optional<std::string>("b"));

    // Single-line beats merged regardless of order
    auto ranked = scan_text("rust",
        "// @collab trust=\"READ_ONLY\"\n"
        "// # separator\n"
        "// @collab trust=\"SUGGEST_ONLY\"\n"
        "// @collab owner=\"m\"\n"
        "fn f() {}\n");
    assert(ranked.regions.size() == 2);
    assert(ranked.regions[0].form == DirectiveForm::MultiLineMerged);
    RegionIndex ranked_index(ranked.regions);
    auto top = ranked_index.query(5, 1);
    assert(top && top->trust() == TrustLevel::ReadOnly);
    assert(top->owner() == std::optional<std::string>("m"));

    std::cout << "  PASS" << std::endl;
}

void test_zero_directives() {
    std::cout << "Testing files without directives..." << std::endl;

    const std::pair<const char*, const char*> files[] = {
        {"rust", "fn main() {\n    // collaborate later\n}\n"},
        {"python", "def f():\n    # @collaborator: bob\n    pass\n"},
        {"shell", "echo hi\n"},
        {"cobol", "DISPLAY 'HI'.\n"},
        {"typescript", ""},
    };
    for (const auto& [language, content] : files) {
        auto r = scan_text(language, content);
        assert(r.regions.empty());
        assert(r.diagnostics.empty());
        RegionIndex index(r.regions);
        assert(!index.query(1, 1));
    }

    std::cout << "  PASS" << std::endl;
}

void test_unsupported_language() {
    std::cout << "Testing unsupported language fallback..." << std::endl;

    auto r = scan("x.zz", "cobol", "// @collab trust=\"READ_ONLY\"\nrun\n");
    assert(r.language == "generic");
    assert(count_kind(r.diagnostics, DiagnosticKind::UnsupportedLanguage) == 1);
    assert(r.regions.size() == 1);
    assert(r.regions[0].kind == ScopeKind::OwnLine);

    std::cout << "  PASS" << std::endl;
}

void test_idempotence() {
    std::cout << "Testing scan idempotence..." << std::endl;

    std::string content =
        "// @collab:begin trust=\"SUPERVISED\"\n"
        "class A {\n"
        "  // @collab trust=\"READ_ONLY\" constraints=[\"no io\", \"pure\"]\n"
        "  f() { return 1; }\n"
        "}\n"
        "// @collab:end\n";
    auto a = to_json(scan("a.ts", "typescript", content), true).dump();
    auto b = to_json(scan("a.ts", "typescript", content), true).dump();
    assert(a == b);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Trust configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_matches_pattern() {
    std::cout << "Testing glob patterns..." << std::endl;

    assert(matches_pattern("src/security/auth.ts", "**/security/**"));
    assert(matches_pattern("security/auth.ts", "**/security/**"));
    assert(matches_pattern("src/a.test.ts", "**/*.test.*"));
    assert(!matches_pattern("src/a.ts", "**/*.test.*"));
    assert(matches_pattern("src/gen/a.ts", "src/*/a.ts"));
    assert(!matches_pattern("src/x/y/a.ts", "src/*/a.ts"));
    assert(matches_pattern("src\\win\\a.ts", "src/**"));
    assert(matches_pattern("a.ts", "?.ts"));
    assert(!matches_pattern("ab.ts", "?.ts"));

    std::cout << "  PASS" << std::endl;
}

void test_check_trust() {
    std::cout << "Testing trust lookup order..." << std::endl;

    TrustConfig config = default_trust_config();
    config.regions.push_back({"src/app.rs", 1, 100, TrustLevel::SuggestOnly, "hot path"});

    auto policy = check_trust(config, "project/src/security/key.ts", nullptr, std::nullopt);
    assert(policy.source == TrustSource::Policy);
    assert(policy.level == TrustLevel::ReadOnly);

    auto fallback = check_trust(config, "project/src/app.rs", nullptr, std::nullopt);
    assert(fallback.source == TrustSource::Default);
    assert(fallback.level == TrustLevel::Supervised);

    auto region = check_trust(config, "project/src/app.rs", nullptr, LineRange{12, 12});
    assert(region.source == TrustSource::Region);
    assert(region.level == TrustLevel::SuggestOnly);

    auto r = scan_text("rust",
        "use std::io;\n"
        "\n"
        "// @collab trust=\"READ_ONLY\" owner=\"core\" constraints=[\"no panics\"]\n"
        "fn f() {\n"
        "    g();\n"
        "}\n"
        "\n"
        "fn h() {}\n");
    RegionIndex index(r.regions);

    auto annotated = check_trust(config, "project/src/app.rs", &index, LineRange{5, 5});
    assert(annotated.source == TrustSource::Annotation);
    assert(annotated.level == TrustLevel::ReadOnly);
    assert(annotated.owner == std::optional<std::string>("core"));
    assert(annotated.constraints.size() == 1);

    // Range reaching into the function still sees the annotation
    auto touching = check_trust(config, "project/src/app.rs", &index, LineRange{1, 4});
    assert(touching.source == TrustSource::Annotation);

    auto outside = check_trust(config, "project/src/app.rs", &index, LineRange{8, 8});
    assert(outside.source == TrustSource::Region);

    std::cout << "  PASS" << std::endl;
}

void test_load_trust_config() {
    std::cout << "Testing trust.json loading..." << std::endl;

    std::string dir = temp_dir();
    std::string path = dir + "/trust.json";
    write_file(path, R"({
        "default_trust": "AUTONOMOUS",
        "policies": [{"pattern": "**/core/**", "trust": "SUGGEST_ONLY", "owner": "core-team"}],
        "regions": [{"file": "src/a.ts", "line_start": 3, "line_end": 9, "trust": "READ_ONLY"}]
    })");

    TrustConfig config;
    std::string error;
    assert(load_trust_config(path, config, error));
    assert(config.default_trust == TrustLevel::Autonomous);
    assert(config.policies.size() == 1);
    assert(config.policies[0].owner == "core-team");
    assert(config.regions.size() == 1 && config.regions[0].line_end == 9);

    TrustConfig missing;
    assert(load_trust_config(dir + "/nope.json", missing, error));
    assert(missing.default_trust == TrustLevel::Supervised);
    assert(missing.policies.empty());

    write_file(path, R"({"default_trust": "MAYBE"})");
    error.clear();
    assert(!load_trust_config(path, config, error));
    assert(error.find("MAYBE") != std::string::npos);

    write_file(path, "{not json");
    error.clear();
    assert(!load_trust_config(path, config, error));
    assert(!error.empty());

    // Round trip through save
    assert(save_trust_config(path, default_trust_config(), error));
    TrustConfig saved;
    assert(load_trust_config(path, saved, error));
    assert(saved.policies.size() == 4);
    assert(saved.policies[3].trust == TrustLevel::ReadOnly);

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Cache, parallel scan, MCP
// ═══════════════════════════════════════════════════════════════════════════

void test_scan_cache() {
    std::cout << "Testing ScanCache..." << std::endl;

    std::string v1 = "// @collab trust=\"READ_ONLY\"\nfn f() {}\n";
    std::string v2 = "// @collab trust=\"AUTONOMOUS\"\nfn f() {}\n";
    assert(content_hash(v1) != content_hash(v2));
    assert(content_hash(v1) == content_hash(std::string(v1)));
    assert(content_hash(v1).size() == 16);

    ScanCache cache;
    auto a = cache.get_or_scan("src/f.rs", "rust", v1);
    auto b = cache.get_or_scan("src/f.rs", "rust", v1);
    assert(a == b);
    assert(cache.hits() == 1);
    assert(cache.size() == 1);

    auto c = cache.get_or_scan("src/f.rs", "rust", v2);
    assert(c != a);
    assert(cache.size() == 1);
    // Old entry stays intact for readers still holding it
    assert(a->index.query(2, 1)->trust() == TrustLevel::ReadOnly);
    assert(c->index.query(2, 1)->trust() == TrustLevel::Autonomous);

    assert(cache.invalidate("src/f.rs"));
    assert(cache.size() == 0);

    cache.get_or_scan("src/f.rs", "rust", v1);
    cache.get_or_scan("src/g.rs", "rust", v2);
    assert(cache.size() == 2);
    cache.clear();
    assert(cache.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_scan_files() {
    std::cout << "Testing parallel scan..." << std::endl;

    std::vector<SourceFile> files;
    for (int i = 0; i < 16; ++i) {
        std::string trust = i % 2 ? "READ_ONLY" : "AUTONOMOUS";
        files.push_back({"f" + std::to_string(i) + ".rs", "rust",
                         "// @collab trust=\"" + trust + "\"\nfn f() {}\n"});
    }

    auto results = scan_files(files, 4);
    assert(results.size() == files.size());
    for (const auto& f : files) {
        const auto& r = results.at(f.path);
        assert(r.regions.size() == 1);
        assert(to_json(r).dump() == to_json(scan(f.path, f.language, f.content)).dump());
    }
    assert(trust_at(results.at("f3.rs"), 2, 1) == std::optional<std::string>("READ_ONLY"));

    assert(scan_files({}, 0).empty());

    std::cout << "  PASS" << std::endl;
}

void test_mcp_handler() {
    std::cout << "Testing MCP handler..." << std::endl;

    std::string dir = temp_dir();
    std::string path = dir + "/app.rs";
    write_file(path,
        "// @collab trust=\"READ_ONLY\" owner=\"core\"\n"
        "fn f() {\n"
        "    g();\n"
        "}\n");

    Workspace workspace;
    mcp::Handler handler(&workspace);
    using mcp::json;

    auto init = json::parse(*handler.handle(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"));
    assert(init["result"]["serverInfo"]["name"] == "collab");

    auto list = json::parse(*handler.handle(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"));
    assert(list["result"]["tools"].size() == 3);

    json call = {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                 {"params", {{"name", "collab_check_trust"},
                             {"arguments", {{"file_path", path}, {"line_start", 3}}}}}};
    auto trust = json::parse(*handler.handle(call.dump()));
    assert(trust["result"]["isError"] == false);
    assert(trust["result"]["structuredContent"]["trust_level"] == "READ_ONLY");
    assert(trust["result"]["structuredContent"]["source"] == "annotation");

    json query = {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                  {"params", {{"name", "collab_query_position"},
                              {"arguments", {{"file_path", path}, {"line", 1}}}}}};
    auto q = json::parse(*handler.handle(query.dump()));
    assert(q["result"]["structuredContent"]["covered"] == false);

    json scan_call = {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                      {"params", {{"name", "collab_scan_annotations"},
                                  {"arguments", {{"file_path", path}}}}}};
    auto s = json::parse(*handler.handle(scan_call.dump()));
    assert(s["result"]["structuredContent"]["regions"].size() == 1);
    assert(workspace.cache().hits() >= 1);

    json missing = {{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"},
                    {"params", {{"name", "collab_scan_annotations"},
                                {"arguments", {{"file_path", dir + "/none.rs"}}}}}};
    auto m = json::parse(*handler.handle(missing.dump()));
    assert(m["result"]["isError"] == true);

    // Unreadable file: configured trust, with the read error alongside
    json unreadable = {{"jsonrpc", "2.0"}, {"id", 9}, {"method", "tools/call"},
                       {"params", {{"name", "collab_check_trust"},
                                   {"arguments", {{"file_path", dir + "/none.rs"}, {"line_start", 2}}}}}};
    auto u = json::parse(*handler.handle(unreadable.dump()));
    assert(u["result"]["isError"] == false);
    assert(u["result"]["structuredContent"]["source"] == "default");
    assert(u["result"]["structuredContent"].contains("annotation_error"));

    auto unknown = json::parse(*handler.handle(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"nope"}})"));
    assert(unknown["error"]["code"] == mcp::error::TOOL_NOT_FOUND);

    auto bad = json::parse(*handler.handle("{oops"));
    assert(bad["error"]["code"] == mcp::error::PARSE_ERROR);

    assert(!handler.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));

    auto bye = json::parse(*handler.handle(R"({"jsonrpc":"2.0","id":8,"method":"shutdown"})"));
    assert(bye["result"]["status"] == "ok");
    assert(handler.shutdown_requested());

    fs::remove_all(dir);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Collab C++ Tests ===" << std::endl;
    std::cout << std::endl;

    test_source_text();
    test_comment_extractor();
    test_language_resolver();

    std::cout << std::endl;
    std::cout << "=== Directives ===" << std::endl;
    test_parse_attributes();
    test_merge_law();
    test_block_comment_directive();
    test_syntax_error_continues();
    test_unknown_trust();
    test_unbalanced_block();
    test_nested_blocks();
    test_nesting_override();
    test_explicit_marker_language();

    std::cout << std::endl;
    std::cout << "=== Scopes and precedence ===" << std::endl;
    test_brace_end_to_end();
    test_brace_fallbacks();
    test_newline_terminated_declarations();
    test_python_indentation();
    test_ruby_indentation();
    test_overlap_not_nested();
    test_identical_scope_tie_break();
    test_zero_directives();
    test_unsupported_language();
    test_idempotence();

    std::cout << std::endl;
    std::cout << "=== Trust and services ===" << std::endl;
    test_matches_pattern();
    test_check_trust();
    test_load_trust_config();
    test_scan_cache();
    test_scan_files();
    test_mcp_handler();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
