#include <gtest/gtest.h>
#include <nbsrc/language_detector.hpp>

using namespace nbsrc;

TEST(LanguageDetectorTest, DetectsDirectiveOnFirstLine) {
    auto lang = LanguageDetector::detect("# MAGIC %sql\n# MAGIC SELECT 1");
    ASSERT_TRUE(lang.has_value());
    EXPECT_EQ(*lang, Language::SQL);
}

TEST(LanguageDetectorTest, DetectsEveryRecognizedToken) {
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %python"), Language::PYTHON);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %sql"), Language::SQL);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %scala"), Language::SCALA);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %r"), Language::R);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %md"), Language::MD);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %sh"), Language::SH);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %run ./other"), Language::RUN);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %pip install requests"), Language::PIP);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %fs ls /"), Language::FS);
}

TEST(LanguageDetectorTest, TokenEndsAtWhitespace) {
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %md\t# Title"), Language::MD);
    EXPECT_EQ(LanguageDetector::detect("# MAGIC %sh echo hi"), Language::SH);
}

TEST(LanguageDetectorTest, UnrecognizedTokenIsDefault) {
    EXPECT_FALSE(LanguageDetector::detect("# MAGIC %md-sandbox").has_value());
    EXPECT_FALSE(LanguageDetector::detect("# MAGIC %javascript").has_value());
    EXPECT_FALSE(LanguageDetector::detect("# MAGIC %").has_value());
}

TEST(LanguageDetectorTest, PlainCodeIsDefault) {
    EXPECT_FALSE(LanguageDetector::detect("print(1)").has_value());
    EXPECT_FALSE(LanguageDetector::detect("").has_value());
    EXPECT_FALSE(LanguageDetector::detect("# MAGIC SELECT 1").has_value());
    EXPECT_FALSE(LanguageDetector::detect("#MAGIC %sql").has_value());
}

TEST(LanguageDetectorTest, OnlyFirstLineIsExamined) {
    EXPECT_FALSE(LanguageDetector::detect("x = 1\n# MAGIC %sql\n# MAGIC SELECT 1").has_value());
}

TEST(LanguageDetectorTest, DetectionIsCaseSensitive) {
    EXPECT_FALSE(LanguageDetector::detect("# MAGIC %SQL").has_value());
}

TEST(LanguageNamesTest, ParseAndName) {
    auto lang = parse_language("scala");
    ASSERT_TRUE(lang.has_value());
    EXPECT_EQ(*lang, Language::SCALA);
    EXPECT_STREQ(language_name(*lang), "scala");

    EXPECT_FALSE(parse_language("unset").has_value());
    EXPECT_FALSE(parse_language("").has_value());
}

TEST(LanguageNamesTest, PythonIsNotWrapEligible) {
    EXPECT_FALSE(wrap_language_for(Language::PYTHON).has_value());

    for (auto lang : {Language::SQL, Language::SCALA, Language::R, Language::MD,
                      Language::SH, Language::FS, Language::RUN, Language::PIP}) {
        auto wrap = wrap_language_for(lang);
        ASSERT_TRUE(wrap.has_value()) << language_name(lang);
        EXPECT_STREQ(language_name(*wrap), language_name(lang));
    }
}
