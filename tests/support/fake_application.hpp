#pragma once
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "officepdf/application.hpp"
#include "officepdf/errors.hpp"

namespace OfficePdf {
namespace Testing {

// In-memory stand-in for the word processor. Writes "%PDF" files on export,
// records every call and fails on request.
class FakeApplication : public Application {
public:
    enum class Step { None, Launch, Open, SaveAs, Close, Quit };

    Step fail_at       = Step::None;
    bool generic_error = false;  // throw std::runtime_error instead of the taxonomy

    std::vector<std::string> calls;
    int                      launches = 0;
    int                      opens    = 0;
    int                      saves    = 0;
    int                      closes   = 0;
    int                      quits    = 0;

    std::string name() const override {
        return "fake";
    }

    void launch() override {
        calls.push_back("launch");
        ++launches;
        maybe_fail(Step::Launch);
        running_ = true;
    }

    DocumentId open(const std::string& path) override {
        calls.push_back("open");
        ++opens;
        maybe_fail(Step::Open);
        if (!std::filesystem::exists(path))
            throw DocumentOpenFailed("No such document: " + path);
        DocumentId id = next_id_++;
        documents_[id] = path;
        return id;
    }

    void save_as(DocumentId document, const std::string& path, int code) override {
        calls.push_back("save_as");
        ++saves;
        last_format_code = code;
        maybe_fail(Step::SaveAs);
        std::ofstream out(path, std::ios::binary);
        if (!out)
            throw ExportFailed("Cannot write " + path);
        out << "%PDF-1.7\n% fake export of " << documents_.at(document) << "\n";
    }

    void close(DocumentId document) override {
        calls.push_back("close");
        ++closes;
        documents_.erase(document);
        maybe_fail(Step::Close);
    }

    void quit() override {
        calls.push_back("quit");
        ++quits;
        running_ = false;
        maybe_fail(Step::Quit);
    }

    bool running() const {
        return running_;
    }
    size_t open_documents() const {
        return documents_.size();
    }

    int last_format_code = -1;

private:
    void maybe_fail(Step step) {
        if (fail_at != step)
            return;
        if (generic_error)
            throw std::runtime_error("injected failure");
        switch (step) {
            case Step::Launch:
                throw ApplicationUnavailable("injected launch failure");
            case Step::Open:
                throw DocumentOpenFailed("injected open failure");
            case Step::SaveAs:
                throw ExportFailed("injected export failure");
            case Step::Close:
            case Step::Quit:
                throw ResourceCleanupFailed("injected cleanup failure");
            case Step::None:
                break;
        }
    }

    std::map<DocumentId, std::string> documents_;
    DocumentId                        next_id_ = 1;
    bool                              running_ = false;
};

}  // namespace Testing
}  // namespace OfficePdf
