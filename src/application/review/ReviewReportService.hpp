/**
 * @file ReviewReportService.hpp
 * @brief Renders change sets and review sessions as plain text / Markdown.
 */

#pragma once

#include <chrono>
#include <string>

#include "domain/model/ChangeSet.hpp"
#include "domain/review/ReviewSession.hpp"

namespace safetyreview::application::review {

using safetyreview::domain::model::ChangeSet;
using safetyreview::domain::model::TextDelta;
using safetyreview::domain::review::ReviewSession;

class ReviewReportService {
public:
    /// "prefix[-deleted-]{+inserted+}suffix"; empty spans are omitted.
    static std::string formatDelta(const TextDelta& delta);

    static std::string changeSetToText(const ChangeSet& changes);
    static std::string changeSetToMarkdown(const ChangeSet& changes);

    // Body used for the review notification mail and the CLI status page.
    static std::string reviewSummary(const ReviewSession& session,
                                     std::chrono::system_clock::time_point now);
};

} // namespace safetyreview::application::review
