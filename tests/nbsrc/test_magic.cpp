#include <gtest/gtest.h>
#include <nbsrc/language_detector.hpp>
#include <nbsrc/magic.hpp>

using namespace nbsrc;

TEST(MagicWrapperTest, WrapsEveryLineBehindPrefix) {
    EXPECT_EQ(MagicWrapper::wrap("SELECT *\nFROM t", Language::SQL),
              "# MAGIC %sql\n# MAGIC SELECT *\n# MAGIC FROM t");
}

TEST(MagicWrapperTest, EmptyLinesBecomeBareMarker) {
    EXPECT_EQ(MagicWrapper::wrap("# Title\n\nSome text", Language::MD),
              "# MAGIC %md\n# MAGIC # Title\n# MAGIC\n# MAGIC Some text");
}

TEST(MagicWrapperTest, EmptyContentIsDirectiveOnly) {
    EXPECT_EQ(MagicWrapper::wrap("", WrapLanguage::SH), "# MAGIC %sh");
}

TEST(MagicWrapperTest, PythonIsNeverWrapped) {
    EXPECT_EQ(MagicWrapper::wrap("print(1)\n\nprint(2)", Language::PYTHON),
              "print(1)\n\nprint(2)");
}

TEST(MagicUnwrapperTest, StripsPrefixAndDirective) {
    EXPECT_EQ(MagicUnwrapper::unwrap("# MAGIC %sql\n# MAGIC SELECT 1"), "SELECT 1");
}

TEST(MagicUnwrapperTest, BareMarkerBecomesEmptyLine) {
    EXPECT_EQ(MagicUnwrapper::unwrap("# MAGIC %md\n# MAGIC a\n# MAGIC\n# MAGIC b"), "a\n\nb");
}

TEST(MagicUnwrapperTest, UnprefixedLinesPassThrough) {
    EXPECT_EQ(MagicUnwrapper::unwrap("x = 1\n# MAGIC y"), "x = 1\ny");
    EXPECT_EQ(MagicUnwrapper::unwrap("print(1)"), "print(1)");
}

TEST(MagicUnwrapperTest, DropsOnlyLeadingDirective) {
    EXPECT_EQ(MagicUnwrapper::unwrap("# MAGIC %sh\n# MAGIC %timeit x"), "%timeit x");
}

TEST(MagicUnwrapperTest, TrimsResult) {
    EXPECT_EQ(MagicUnwrapper::unwrap("# MAGIC %md\n# MAGIC\n# MAGIC text\n# MAGIC\n"), "text");
}

TEST(MagicWrapperTest, UnwrapInvertsWrapForEligibleLanguages) {
    const std::string content = "line one\n\n  indented line\nlast";
    for (auto lang : {WrapLanguage::MD, WrapLanguage::SQL, WrapLanguage::SCALA,
                      WrapLanguage::R, WrapLanguage::SH, WrapLanguage::FS,
                      WrapLanguage::RUN, WrapLanguage::PIP}) {
        EXPECT_EQ(MagicUnwrapper::unwrap(MagicWrapper::wrap(content, lang)), content)
            << language_name(lang);
    }
}
