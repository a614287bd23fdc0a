#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "../../src/core/logger/logger.hpp"
#include "../../src/office/session/session.hpp"
#include "../support/fake_application.hpp"

using namespace OfficePdf;
using namespace OfficePdf::Office;
using OfficePdf::Testing::FakeApplication;
namespace fs = std::filesystem;

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        std::ofstream("session_input.docx") << "fake docx";
    }

    void TearDown() override {
        fs::remove("session_input.docx");
        fs::remove("session_output.pdf");
        Core::Logger::set_level(Core::LOG_DEFAULT);
    }
};

TEST_F(SessionTest, QuitsOnScopeExit) {
    FakeApplication app;
    {
        ApplicationSession session(app);
        EXPECT_TRUE(session.active());
        EXPECT_TRUE(app.running());
    }
    EXPECT_EQ(app.launches, 1);
    EXPECT_EQ(app.quits, 1);
    EXPECT_FALSE(app.running());
}

TEST_F(SessionTest, ExplicitQuitIsNotRepeated) {
    FakeApplication app;
    {
        ApplicationSession session(app);
        session.quit();
        EXPECT_FALSE(session.active());
        session.quit();
    }
    EXPECT_EQ(app.quits, 1);
}

TEST_F(SessionTest, FailedLaunchDoesNotQuit) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Launch;

    EXPECT_THROW(ApplicationSession session(app), ApplicationUnavailable);
    EXPECT_EQ(app.launches, 1);
    EXPECT_EQ(app.quits, 0);
}

TEST_F(SessionTest, GenericLaunchErrorBecomesApplicationUnavailable) {
    FakeApplication app;
    app.fail_at       = FakeApplication::Step::Launch;
    app.generic_error = true;

    try {
        ApplicationSession session(app);
        FAIL() << "expected ApplicationUnavailable";
    } catch (const ApplicationUnavailable& e) {
        EXPECT_EQ(e.status(), Status::ApplicationUnavailable);
        EXPECT_NE(std::string(e.what()).find("injected failure"), std::string::npos);
    }
}

TEST_F(SessionTest, ExplicitQuitFailureIsReported) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Quit;
    {
        ApplicationSession session(app);
        EXPECT_THROW(session.quit(), ResourceCleanupFailed);
    }
    EXPECT_EQ(app.quits, 1);
}

TEST_F(SessionTest, DestructorLogsQuitFailure) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Quit;
    EXPECT_NO_THROW({ ApplicationSession session(app); });
    EXPECT_EQ(app.quits, 1);
}

TEST_F(SessionTest, DocumentClosedOnScopeExit) {
    FakeApplication app;
    ApplicationSession session(app);
    {
        OpenDocument document(app, "session_input.docx");
        EXPECT_TRUE(document.is_open());
        EXPECT_EQ(app.open_documents(), 1u);
    }
    EXPECT_EQ(app.closes, 1);
    EXPECT_EQ(app.open_documents(), 0u);
}

TEST_F(SessionTest, DocumentClosedOnceAfterExplicitClose) {
    FakeApplication app;
    ApplicationSession session(app);
    {
        OpenDocument document(app, "session_input.docx");
        document.close();
        document.close();
        EXPECT_FALSE(document.is_open());
    }
    EXPECT_EQ(app.closes, 1);
}

TEST_F(SessionTest, FailedOpenDoesNotClose) {
    FakeApplication app;
    ApplicationSession session(app);

    EXPECT_THROW(OpenDocument document(app, "missing.docx"), DocumentOpenFailed);
    EXPECT_EQ(app.closes, 0);
}

TEST_F(SessionTest, GenericOpenErrorBecomesDocumentOpenFailed) {
    FakeApplication app;
    app.fail_at       = FakeApplication::Step::Open;
    app.generic_error = true;
    ApplicationSession session(app);

    EXPECT_THROW(OpenDocument document(app, "session_input.docx"), DocumentOpenFailed);
}

TEST_F(SessionTest, SaveAfterCloseFails) {
    FakeApplication app;
    ApplicationSession session(app);
    OpenDocument document(app, "session_input.docx");
    document.close();

    EXPECT_THROW(document.save_as("session_output.pdf", 17), ExportFailed);
    EXPECT_EQ(app.saves, 0);
}

TEST_F(SessionTest, GenericSaveErrorBecomesExportFailed) {
    FakeApplication app;
    app.fail_at       = FakeApplication::Step::SaveAs;
    app.generic_error = true;
    ApplicationSession session(app);
    OpenDocument document(app, "session_input.docx");

    EXPECT_THROW(document.save_as("session_output.pdf", 17), ExportFailed);
}

TEST_F(SessionTest, CloseFailureIsReportedOnce) {
    FakeApplication app;
    app.fail_at = FakeApplication::Step::Close;
    ApplicationSession session(app);
    {
        OpenDocument document(app, "session_input.docx");
        EXPECT_THROW(document.close(), ResourceCleanupFailed);
        EXPECT_FALSE(document.is_open());
    }
    EXPECT_EQ(app.closes, 1);
}
