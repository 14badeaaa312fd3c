#include <gtest/gtest.h>
#include <ocr_layout/dump_catalog.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using ocr_layout::DumpCatalog;

class DumpCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("ocr_layout_catalog_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void touch(const fs::path& relative) {
        fs::create_directories((root_ / relative).parent_path());
        std::ofstream(root_ / relative) << "level\tleft\ttop\twidth\theight\tconf\ttext\n";
    }

    fs::path root_;
};

TEST_F(DumpCatalogTest, RecognizesDumpFiles) {
    EXPECT_TRUE(DumpCatalog::is_dump("page.tsv"));
    EXPECT_TRUE(DumpCatalog::is_dump("dir/PAGE.JSON"));
    EXPECT_FALSE(DumpCatalog::is_dump("page.png"));
    EXPECT_FALSE(DumpCatalog::is_dump("page_ocr.json"));
    EXPECT_FALSE(DumpCatalog::is_dump("page.tsv_OCR.json"));
    EXPECT_FALSE(DumpCatalog::is_dump("scan.ts\xC3\xA9"));
}

TEST_F(DumpCatalogTest, SameStemInDifferentPlacesGetsDistinctOutputs) {
    fs::path out = root_ / "out";

    auto a = DumpCatalog::output_path(root_ / "a" / "x.tsv", root_, out);
    auto b = DumpCatalog::output_path(root_ / "b" / "x.tsv", root_, out);
    auto c = DumpCatalog::output_path(root_ / "x.json", root_, out);
    auto d = DumpCatalog::output_path(root_ / "x.tsv", root_, out);

    EXPECT_EQ(a, out / "a" / "x.tsv_ocr.json");
    EXPECT_EQ(b, out / "b" / "x.tsv_ocr.json");
    EXPECT_EQ(c, out / "x.json_ocr.json");
    EXPECT_EQ(d, out / "x.tsv_ocr.json");
}

TEST_F(DumpCatalogTest, DumpOutsideRootKeepsFileName) {
    auto path = DumpCatalog::output_path("/elsewhere/page.tsv", root_, root_ / "out");
    EXPECT_EQ(path, root_ / "out" / "page.tsv_ocr.json");
}

TEST_F(DumpCatalogTest, CollectsRecursivelyAndSkipsOutputDirectory) {
    touch("a/x.tsv");
    touch("b/x.tsv");
    touch("x.json");
    touch("notes.txt");
    touch("out/a/x.tsv_ocr.json");
    touch("out/stale.tsv");
    touch("old_ocr.json");

    auto dumps = DumpCatalog::collect(root_, root_ / "out");

    std::vector<std::string> expected = {
        (root_ / "a" / "x.tsv").string(),
        (root_ / "b" / "x.tsv").string(),
        (root_ / "x.json").string(),
    };
    EXPECT_EQ(dumps, expected);
}

TEST_F(DumpCatalogTest, MissingSkipDirectoryIsFine) {
    touch("page.tsv");

    auto dumps = DumpCatalog::collect(root_, root_ / "not_created_yet");

    ASSERT_EQ(dumps.size(), 1u);
    EXPECT_EQ(dumps[0], (root_ / "page.tsv").string());
}
