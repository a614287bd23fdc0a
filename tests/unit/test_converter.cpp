#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "../../src/core/logger/logger.hpp"
#include "../support/fake_application.hpp"
#include "officepdf/converter.hpp"

using namespace OfficePdf;
using OfficePdf::Testing::FakeApplication;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

class ConverterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        if (fs::exists(dir_))
            fs::remove_all(dir_);
        fs::create_directory(dir_);
        std::ofstream(dir_ / "report.docx") << "fake docx";
    }

    void TearDown() override {
        if (fs::exists(dir_))
            fs::remove_all(dir_);
        Core::Logger::set_level(Core::LOG_DEFAULT);
    }

    fs::path dir_ = "test_converter_out";
};

TEST_F(ConverterTest, ProducesOutputFile) {
    FakeApplication app;
    fs::path        output = dir_ / "report.pdf";
    ASSERT_FALSE(fs::exists(output));

    convert_to_pdf(app, (dir_ / "report.docx").string(), output.string());

    EXPECT_TRUE(fs::exists(output));
    EXPECT_EQ(read_file(output).rfind("%PDF", 0), 0u);
    EXPECT_EQ(app.last_format_code, 17);
}

TEST_F(ConverterTest, RunsStepsInOrder) {
    FakeApplication app;
    convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "report.pdf").string());

    std::vector<std::string> expected = {"launch", "open", "save_as", "close", "quit"};
    EXPECT_EQ(app.calls, expected);
}

TEST_F(ConverterTest, PassesFormatCodeThrough) {
    FakeApplication app;
    convert(app, (dir_ / "report.docx").string(), (dir_ / "report.odt").string(), 23);
    EXPECT_EQ(app.last_format_code, 23);
}

TEST_F(ConverterTest, TwoOutputsAreIndependent) {
    FakeApplication first;
    FakeApplication second;
    fs::path        a = dir_ / "a.pdf";
    fs::path        b = dir_ / "b.pdf";

    convert_to_pdf(first, (dir_ / "report.docx").string(), a.string());
    convert_to_pdf(second, (dir_ / "report.docx").string(), b.string());

    EXPECT_TRUE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));
    fs::remove(a);
    EXPECT_TRUE(fs::exists(b));
}

TEST_F(ConverterTest, SameApplicationCanRunTwice) {
    FakeApplication app;
    convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "a.pdf").string());
    convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "b.pdf").string());

    EXPECT_EQ(app.launches, 2);
    EXPECT_EQ(app.quits, 2);
    EXPECT_TRUE(fs::exists(dir_ / "a.pdf"));
    EXPECT_TRUE(fs::exists(dir_ / "b.pdf"));
}

TEST_F(ConverterTest, MissingInputWritesNothing) {
    FakeApplication app;
    fs::path        output = dir_ / "missing.pdf";

    EXPECT_THROW(convert_to_pdf(app, (dir_ / "missing.docx").string(), output.string()),
                 DocumentOpenFailed);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_EQ(app.saves, 0);
    EXPECT_EQ(app.closes, 0);
    EXPECT_EQ(app.quits, 1);
}

TEST_F(ConverterTest, UnavailableApplicationLeavesNothingRunning) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Launch;

    EXPECT_THROW(convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "r.pdf").string()),
                 ApplicationUnavailable);
    EXPECT_FALSE(app.running());
    EXPECT_EQ(app.opens, 0);
    EXPECT_EQ(app.quits, 0);
}

TEST_F(ConverterTest, ExportFailureReleasesEverythingOnce) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::SaveAs;

    EXPECT_THROW(convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "r.pdf").string()),
                 ExportFailed);
    EXPECT_EQ(app.closes, 1);
    EXPECT_EQ(app.quits, 1);
    EXPECT_FALSE(app.running());
    EXPECT_EQ(app.open_documents(), 0u);
}

TEST_F(ConverterTest, CloseFailureStillQuits) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Close;

    EXPECT_THROW(convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "r.pdf").string()),
                 ResourceCleanupFailed);
    EXPECT_EQ(app.closes, 1);
    EXPECT_EQ(app.quits, 1);
}

TEST_F(ConverterTest, QuitFailureIsReported) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Quit;

    EXPECT_THROW(convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "r.pdf").string()),
                 ResourceCleanupFailed);
    EXPECT_EQ(app.quits, 1);
    EXPECT_TRUE(fs::exists(dir_ / "r.pdf"));
}

TEST_F(ConverterTest, ErrorsCarryStatus) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::SaveAs;

    try {
        convert_to_pdf(app, (dir_ / "report.docx").string(), (dir_ / "r.pdf").string());
        FAIL() << "expected ExportFailed";
    } catch (const ConversionError& e) {
        EXPECT_EQ(e.status(), Status::ExportFailed);
        EXPECT_STREQ(status_name(e.status()), "export failed");
    }
}
