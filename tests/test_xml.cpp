#include "xml.hpp"
#include <gtest/gtest.h>

TEST(Xml, EscapeTextLeavesQuotes) {
  EXPECT_EQ(escape_text("if a < b && b > c { \"x\" }"),
            "if a &lt; b &amp;&amp; b &gt; c { \"x\" }");
}

TEST(Xml, EscapeAttrQuotes) {
  EXPECT_EQ(escape_attr("a\"b'c<&>"), "a&quot;b&apos;c&lt;&amp;&gt;");
}

TEST(Xml, RawTextWhenEscapingOff) {
  EXPECT_EQ(maybe_escape_text("a < b", false), "a < b");
  EXPECT_EQ(maybe_escape_text("a < b", true), "a &lt; b");
}

TEST(Xml, AttributesStayWellFormedWhenEscapingOff) {
  EXPECT_EQ(maybe_escape_attr("src/main.rs", false), "src/main.rs");
  EXPECT_EQ(maybe_escape_attr("we\"ird.txt", false), "we&quot;ird.txt");
  EXPECT_EQ(maybe_escape_attr("a&b", false), "a&amp;b");
  EXPECT_EQ(maybe_escape_attr("it's", false), "it's");
  EXPECT_EQ(maybe_escape_attr("it's", true), "it&apos;s");
}

TEST(Xml, PathParts) {
  EXPECT_EQ(file_name_of("src/a/main.cpp"), "main.cpp");
  EXPECT_EQ(folder_of("src/a/main.cpp"), "src/a");
  EXPECT_EQ(folder_of("main.cpp"), ".");
  EXPECT_EQ(slash_path("src\\a\\main.cpp"), "src/a/main.cpp");
}
