#include "test_common.h"
#include "codebox/extract.h"

using namespace codebox;

int main() {
    // Test 1: first js fence, trimmed
    {
        auto c = extract_code("Here you go:\n```js\n  finalAnswer(1);\n```\nand more\n```js\nsecond()\n```");
        expect_true(c.has_value(), "js fence should be found");
        expect_true(*c == "finalAnswer(1);", "body should be trimmed, got: " + c.value_or(""));
    }

    // Test 2: javascript tag accepted
    {
        auto c = extract_code("```javascript\nconst x = 1;\nfinalAnswer(x)\n```");
        expect_true(c.has_value() && *c == "const x = 1;\nfinalAnswer(x)", "javascript fence");
    }

    // Test 2b: the tag is matched without regard to case
    {
        auto a = extract_code("```JS\nfinalAnswer(1)\n```");
        expect_true(a.has_value() && *a == "finalAnswer(1)", "JS fence");
        auto b = extract_code("```Javascript\nfinalAnswer(2)\n```");
        expect_true(b.has_value() && *b == "finalAnswer(2)", "Javascript fence");
        expect_true(!extract_code("```JSON\n{\"a\":1}\n```").has_value(), "JSON fence is not js");
    }

    // Test 3: other languages and bare fences are ignored
    {
        expect_true(!extract_code("```python\nprint(1)\n```").has_value(), "python fence ignored");
        expect_true(!extract_code("```\nfinalAnswer(1)\n```").has_value(), "untagged fence ignored");
        expect_true(!extract_code("no code at all").has_value(), "prose only");
        auto c = extract_code("```ts\nlet a: number = 1\n```\n```js\nok()\n```");
        expect_true(c.has_value() && *c == "ok()", "skips to the first js fence");
    }

    // Test 4: blank or unterminated blocks
    {
        expect_true(!extract_code("```js\n   \n```").has_value(), "whitespace-only body");
        expect_true(!extract_code("```js\nfinalAnswer(1)").has_value(), "unterminated fence");
    }

    // Test 5: lazy return rewrites a trailing expression
    {
        expect_true(apply_lazy_return("1 + 2") == "return (1 + 2);", "single expression");
        std::string out = apply_lazy_return("const x = 5;\nx * 2;\n");
        expect_true(out == "const x = 5;\nreturn (x * 2);\n", "last line rewritten, got: " + out);
        out = apply_lazy_return("const r = await webSearch('x');\n  r.results");
        expect_true(out == "const r = await webSearch('x');\n  return (r.results);", "indent kept, got: " + out);
    }

    // Test 6: lazy return leaves everything else alone
    {
        const char* unchanged[] = {
            "finalAnswer(1)",
            "const x = 1;\nfinalAnswer(x);\nx",
            "return 5",
            "const a = 1;\nreturn a;\na",
            "if (a) {\n  b\n}",
            "const a = 1 +\n2",
            "const x = 1",
            "foo(\n  1,\n  2)",
            "a; b",
            "x // note",
            "",
        };
        for (const char* src : unchanged) {
            expect_true(apply_lazy_return(src) == src, std::string("should be unchanged: ") + src);
        }
    }

    // Test 7: nested return inside a function body does not block the rewrite
    {
        std::string src = "function f() {\n  return 3;\n}\nf()";
        std::string out = apply_lazy_return(src);
        expect_true(out == "function f() {\n  return 3;\n}\nreturn (f());", "got: " + out);
    }

    // Test 8: truncate_output / join_lines
    {
        std::string s = "abcdef";
        expect_true(truncate_output(s, 3) && s == "abc", "cut to 3");
        expect_true(!truncate_output(s, 10) && s == "abc", "no cut");
        expect_true(join_lines({"a", "b", "c"}) == "a\nb\nc", "join");
        expect_true(join_lines({}) == "", "join empty");
    }

    // Test 9: CappedLines keeps the joined text within the cap exactly
    {
        CappedLines cl(11);
        cl.push("hello");       // 5
        cl.push("wor");         // 5 + 1 + 3 = 9
        cl.push("ld and more"); // 1 byte of room after the separator
        cl.push("ignored");
        expect_true(cl.truncated(), "should be truncated");
        std::string joined = join_lines(cl.take());
        expect_eq_ll((long long)joined.size(), 11, "joined size");
        expect_true(joined == "hello\nwor\nl", "joined text: " + joined);
    }
    {
        // Only the separator fits: an empty line keeps the size exact.
        CappedLines cl(10);
        cl.push("hello");
        cl.push("wor");
        cl.push("x");
        expect_true(cl.truncated(), "separator-only room truncates");
        expect_true(join_lines(cl.take()) == "hello\nwor\n", "trailing separator");
    }
    {
        CappedLines cl(100);
        for (int i = 0; i < 5; i++) cl.push("line" + std::to_string(i));
        expect_true(!cl.truncated(), "well under the cap");
        expect_eq_ll((long long)cl.take().size(), 5, "all lines kept");
    }

    // Test 10: caps count UTF-8 characters and never split one
    {
        std::string fits = "aaaaaaaaa\xc3\xa9";  // 9 x 'a' + U+00E9, 10 characters in 11 bytes
        std::string s = fits;
        expect_true(!truncate_output(s, 10) && s == fits, "10 characters fit a cap of 10");
        expect_true(truncate_output(s, 9) && s == "aaaaaaaaa", "cut before the two-byte character");

        std::string wide = "\xe6\x97\xa5\xe6\x9c\xac\xe8\xaa\x9e";  // three 3-byte characters
        expect_true(truncate_output(wide, 2) && wide == "\xe6\x97\xa5\xe6\x9c\xac", "cut between characters");

        CappedLines one(10);
        one.push(fits);
        expect_true(!one.truncated(), "line of exactly 10 characters is kept whole");

        CappedLines cl(4);
        cl.push("\xc3\xa9\xc3\xa9");             // 2 characters
        cl.push("\xf0\x9f\x98\x80\xf0\x9f\x98\x80");  // separator + 1 of 2 four-byte characters fits
        expect_true(cl.truncated(), "second line crosses the cap");
        std::string joined = join_lines(cl.take());
        expect_true(joined == "\xc3\xa9\xc3\xa9\n\xf0\x9f\x98\x80", "cut on a character boundary");
    }

    std::cerr << "test_extract: ALL PASSED" << std::endl;
    return 0;
}
