#include <gtest/gtest.h>
#include <nbsrc/cell_ops.hpp>
#include <nbsrc/cell_splitter.hpp>

using namespace nbsrc;

class CellOpsTest : public ::testing::Test {
protected:
    void SetUp() override {
        cells_ = parse("# Databricks notebook source\n"
                       "\n"
                       "# COMMAND ----------\n"
                       "\n"
                       "print(1)\n"
                       "\n"
                       "# COMMAND ----------\n"
                       "\n"
                       "# MAGIC %sql\n"
                       "# MAGIC SELECT 1");
        ASSERT_EQ(cells_.size(), 2);
    }

    static void expect_contiguous(const Cells& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            EXPECT_EQ(cells[i].index, i);
        }
    }

    Cells cells_;
};

// ============================================================================
// get
// ============================================================================

TEST_F(CellOpsTest, GetReturnsCell) {
    auto cell = get_cell(cells_, 1);
    ASSERT_TRUE(cell.ok());
    EXPECT_EQ(cell.value(), cells_[1]);
}

TEST_F(CellOpsTest, GetOutOfRange) {
    auto cell = get_cell(cells_, 5);
    ASSERT_FALSE(cell.ok());
    EXPECT_EQ(cell.error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_NE(cell.error().message().find("5"), std::string::npos);
    EXPECT_NE(cell.error().message().find("[0, 1]"), std::string::npos);

    EXPECT_EQ(get_cell(cells_, 2).error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(get_cell(cells_, -1).error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(get_cell({}, 0).error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
}

// ============================================================================
// update
// ============================================================================

TEST_F(CellOpsTest, UpdateReplacesContentOnly) {
    auto updated = update_cell(cells_, 0, std::string("  print(2)\n"));
    ASSERT_TRUE(updated.ok()) << updated.error().to_string();

    auto& cells = updated.value();
    ASSERT_EQ(cells.size(), 2);
    EXPECT_EQ(cells[0].content, "print(2)");
    EXPECT_FALSE(cells[0].language.has_value());
    EXPECT_EQ(cells[1], cells_[1]);

    // Input is untouched
    EXPECT_EQ(cells_[0].content, "print(1)");
}

TEST_F(CellOpsTest, UpdateWithLanguageWraps) {
    auto updated = update_cell(cells_, 0, std::string("# Heading\n\ntext"), Language::MD);
    ASSERT_TRUE(updated.ok());
    EXPECT_EQ(updated.value()[0].content, "# MAGIC %md\n# MAGIC # Heading\n# MAGIC\n# MAGIC text");
    EXPECT_EQ(updated.value()[0].language, Language::MD);
}

TEST_F(CellOpsTest, UpdateWithPythonTagsWithoutWrapping) {
    auto updated = update_cell(cells_, 1, std::string("x = 1"), Language::PYTHON);
    ASSERT_TRUE(updated.ok());
    EXPECT_EQ(updated.value()[1].content, "x = 1");
    EXPECT_EQ(updated.value()[1].language, Language::PYTHON);
}

TEST_F(CellOpsTest, UpdateWithoutLanguageKeepsExistingTag) {
    auto updated = update_cell(cells_, 1, std::string("x = 1"));
    ASSERT_TRUE(updated.ok()) << updated.error().to_string();
    EXPECT_EQ(updated.value()[1].content, "x = 1");
    EXPECT_EQ(updated.value()[1].language, Language::SQL);
}

TEST_F(CellOpsTest, UpdateErrors) {
    EXPECT_EQ(update_cell(cells_, 2, std::string("x")).error_code(),
              ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(update_cell(cells_, 0, std::nullopt).error_code(),
              ErrorCode::MISSING_CONTENT);
}

// ============================================================================
// insert
// ============================================================================

TEST_F(CellOpsTest, InsertShiftsLaterCells) {
    auto inserted = insert_cell(cells_, 1, std::string("ls -la"), Language::SH);
    ASSERT_TRUE(inserted.ok()) << inserted.error().to_string();

    auto& cells = inserted.value();
    ASSERT_EQ(cells.size(), 3);
    EXPECT_EQ(cells[0].content, "print(1)");
    EXPECT_EQ(cells[1].content, "# MAGIC %sh\n# MAGIC ls -la");
    EXPECT_EQ(cells[1].language, Language::SH);
    EXPECT_EQ(cells[2].content, cells_[1].content);
    expect_contiguous(cells);
}

TEST_F(CellOpsTest, InsertAtEndAppends) {
    auto inserted = insert_cell(cells_, 2, std::string("x = 1"));
    ASSERT_TRUE(inserted.ok());
    ASSERT_EQ(inserted.value().size(), 3);
    EXPECT_EQ(inserted.value()[2].content, "x = 1");
    EXPECT_FALSE(inserted.value()[2].language.has_value());
    expect_contiguous(inserted.value());
}

TEST_F(CellOpsTest, InsertIntoEmptyNotebook) {
    auto inserted = insert_cell({}, 0, std::string("x"));
    ASSERT_TRUE(inserted.ok());
    ASSERT_EQ(inserted.value().size(), 1);
    EXPECT_EQ(inserted.value()[0].index, 0);
}

TEST_F(CellOpsTest, InsertErrors) {
    EXPECT_EQ(insert_cell(cells_, 3, std::string("x")).error_code(),
              ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(insert_cell(cells_, -1, std::string("x")).error_code(),
              ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(insert_cell(cells_, 0, std::nullopt).error_code(),
              ErrorCode::MISSING_CONTENT);
}

// ============================================================================
// delete
// ============================================================================

TEST_F(CellOpsTest, DeleteFirstCellShiftsDown) {
    auto deleted = delete_cell(cells_, 0);
    ASSERT_TRUE(deleted.ok());

    auto& cells = deleted.value();
    ASSERT_EQ(cells.size(), 1);
    EXPECT_EQ(cells[0].index, 0);
    EXPECT_EQ(cells[0].content, cells_[1].content);
    EXPECT_EQ(cells[0].language, cells_[1].language);
}

TEST_F(CellOpsTest, DeleteOutOfRange) {
    EXPECT_EQ(delete_cell(cells_, 2).error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(delete_cell({}, 0).error_code(), ErrorCode::INDEX_OUT_OF_RANGE);
}

TEST_F(CellOpsTest, DeleteUndoesInsertAtEveryPosition) {
    for (int64_t i = 0; i <= static_cast<int64_t>(cells_.size()); ++i) {
        for (auto language : {std::optional<Language>(), std::optional<Language>(Language::SQL)}) {
            auto inserted = insert_cell(cells_, i, std::string("new cell"), language);
            ASSERT_TRUE(inserted.ok());
            auto restored = delete_cell(inserted.value(), i);
            ASSERT_TRUE(restored.ok());
            EXPECT_EQ(restored.value(), cells_) << "position " << i;
        }
    }
}
