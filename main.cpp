#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/review/ReviewReportService.hpp"
#include "application/review/ReviewService.hpp"
#include "domain/review/ReviewErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/review/ReviewEventStoreFs.hpp"
#include "infrastructure/review/ReviewJsonCodec.hpp"
#include "infrastructure/review/ReviewSessionRepositoryFs.hpp"
#include "infrastructure/review/VersionHistoryRepositoryFs.hpp"

namespace fs = std::filesystem;
using namespace safetyreview;

namespace {

void PrintUsage() {
    std::cout << "Usage: safetyreview [projectRoot] <command>\n"
              << "  list                      reviews and their status\n"
              << "  history                   approved versions\n"
              << "  compare <base> <other>    diff two versions (\"working\" = model.json)\n"
              << "  status <reviewId>         review summary\n";
}

bool IsCommand(const std::string& arg) {
    return arg == "list" || arg == "history" || arg == "compare" || arg == "status";
}

// The editor exports its working model as <root>/model.json.
void LoadWorkingModel(const fs::path& root, domain::model::EntityStore& store) {
    fs::path modelPath = root / "model.json";
    if (!fs::exists(modelPath)) return;

    std::ifstream in(modelPath);
    try {
        nlohmann::json j;
        in >> j;
        store.restore(infrastructure::review::codec::SnapshotFromJson(j));
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Main] Ignoring unreadable model.json: " << e.what() << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    fs::path root = infrastructure::PathUtils::GetProjectsDir() / "default";
    if (!args.empty() && !IsCommand(args.front())) {
        root = args.front();
        args.erase(args.begin());
    }
    if (args.empty()) {
        PrintUsage();
        return 1;
    }

    const std::string& command = args[0];
    infrastructure::ReviewSettings settings = infrastructure::ConfigLoader::LoadReviewSettings(root.string());

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto store = std::make_shared<domain::model::EntityStore>();
    auto sessions = std::make_shared<infrastructure::review::ReviewSessionRepositoryFs>(
        std::make_unique<infrastructure::review::ReviewEventStoreFs>(root.string(), persistence));
    auto versions = std::make_shared<infrastructure::review::VersionHistoryRepositoryFs>(root.string(), persistence);

    try {
        LoadWorkingModel(root, *store);
        application::review::ReviewService service(store, sessions, versions, settings);
        using application::review::ReviewReportService;

        if (command == "list") {
            auto now = service.now();
            for (const auto* session : service.registry().sessions()) {
                std::cout << session->getId() << "  " << session->getName() << "  "
                          << domain::review::KindToString(session->getKind()) << "  "
                          << domain::review::StatusToString(session->status(now)) << "\n";
            }
        } else if (command == "history") {
            for (const auto& version : service.registry().approvedHistory()) {
                std::cout << version.label << "  " << version.sessionId << "  " << version.approver << "\n";
            }
        } else if (command == "compare" && args.size() == 3) {
            std::cout << ReviewReportService::changeSetToText(service.compareVersions(args[1], args[2]));
        } else if (command == "status" && args.size() == 2) {
            std::cout << ReviewReportService::reviewSummary(service.getReview(args[1]), service.now());
        } else {
            PrintUsage();
            return 1;
        }
    } catch (const domain::review::ReviewError& e) {
        std::cerr << "[Main] " << e.what() << "\n  " << e.guidance() << std::endl;
        return 2;
    } catch (const domain::model::MalformedSnapshotError& e) {
        std::cerr << "[Main] Malformed snapshot: " << e.what() << std::endl;
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "[Main] Review storage is damaged: " << e.what() << std::endl;
        return 3;
    }

    persistence->stop();
    return 0;
}
