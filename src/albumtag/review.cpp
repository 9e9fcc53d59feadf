// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <string>
#include <utility>
#include <vector>

#include "albumtag/review.h"
#include "internal.h"

using namespace albumtag::detail;

namespace albumtag {
namespace {

constexpr const char kPromptSelectTrackChange[] =
    "Enter number of any selection you want to change: (return finishes, 'q' quits) ";
constexpr const char kPromptSelectNewTrack[] =
    "Select the new track number: (return cancels, 'q' quits) ";
constexpr const char kOutOfRange[] = "Selection is outside the available range";

bool is_quit(const std::string& line) {
    return line == "q" || line == "Q";
}

}  // namespace

std::string describe_candidate(
    const TrackCandidate& candidate,
    const Console& console) {

    const std::string name = candidate.path.filename().string();
    const std::string start = console.color(Color::Cyan);
    const std::string end = console.color(Color::Default);

    if (!candidate.title) {
        return console.color(Color::Yellow) + "'" + name + "' will remain unchanged" + end;
    }
    if (const auto* automatic = std::get_if<AutomaticMatch>(&candidate.match)) {
        const HighlightMarkers markers{start, console.color(Color::Red), end};
        return format_highlighted(name, *automatic, markers) +
            " -> " + start + *candidate.title + end;
    }
    return start + name + " -> " + *candidate.title + end;
}

void display_match_summary(
    const std::vector<TrackCandidate>& candidates,
    Console& console) {

    for (size_t i = 0; i < candidates.size(); ++i) {
        console.print_line(std::to_string(i + 1) + " - " + describe_candidate(candidates[i], console));
    }
}

/* ------------------------------------------------------------------- */

ReviewSession::ReviewSession(
    std::vector<TrackCandidate> candidates,
    std::vector<std::string> tracklist,
    Console& console)
    : candidates_(std::move(candidates)),
      tracklist_(std::move(tracklist)),
      console_(console) {}

std::string ReviewSession::prompt() const {
    switch (state_) {
        case ReviewState::AwaitingSelection: return kPromptSelectTrackChange;
        case ReviewState::AwaitingTitleChoice: return kPromptSelectNewTrack;
        default: return {};
    }
}

ReviewSignal ReviewSession::step() {
    switch (state_) {
        case ReviewState::Listing:
            console_.print_line("");
            display_match_summary(candidates_, console_);
            console_.print_line("");
            state_ = ReviewState::AwaitingSelection;
            return ReviewSignal::Continue;
        case ReviewState::AwaitingSelection:
        case ReviewState::AwaitingTitleChoice: {
            const auto line = console_.read_line(prompt());
            if (!line) {
                state_ = ReviewState::Aborted;
                return ReviewSignal::Aborted;
            }
            return handle_input(*line);
        }
        case ReviewState::Committed:
            return ReviewSignal::Committed;
        case ReviewState::Aborted:
            return ReviewSignal::Aborted;
    }
    return ReviewSignal::Aborted;
}

ReviewSignal ReviewSession::handle_input(const std::string& line) {
    switch (state_) {
        case ReviewState::AwaitingSelection: return handle_selection(line);
        case ReviewState::AwaitingTitleChoice: return handle_title_choice(line);
        case ReviewState::Committed: return ReviewSignal::Committed;
        case ReviewState::Aborted: return ReviewSignal::Aborted;
        case ReviewState::Listing: return ReviewSignal::Continue;
    }
    return ReviewSignal::Continue;
}

ReviewSignal ReviewSession::run() {
    while (true) {
        const ReviewSignal signal = step();
        if (signal == ReviewSignal::Committed || signal == ReviewSignal::Aborted) {
            return signal;
        }
    }
}

ReviewSignal ReviewSession::handle_selection(const std::string& line) {
    if (line.empty()) {
        state_ = ReviewState::Committed;
        return ReviewSignal::Committed;
    }
    if (is_quit(line)) {
        state_ = ReviewState::Aborted;
        return ReviewSignal::Aborted;
    }

    int choice = 0;
    if (!parse_int_strict(line, choice)) return ReviewSignal::Continue;
    if (choice < 1 || static_cast<size_t>(choice) > candidates_.size()) {
        console_.print_line(kOutOfRange);
        return ReviewSignal::Continue;
    }

    selected_ = static_cast<size_t>(choice - 1);
    console_.print_line(describe_candidate(candidates_[selected_], console_));
    display_tracklist();
    state_ = ReviewState::AwaitingTitleChoice;
    return ReviewSignal::Continue;
}

ReviewSignal ReviewSession::handle_title_choice(const std::string& line) {
    if (line.empty()) {
        console_.print_line("Cancelled new track selection");
        state_ = ReviewState::Listing;
        return ReviewSignal::Cancelled;
    }
    if (is_quit(line)) {
        state_ = ReviewState::Aborted;
        return ReviewSignal::Aborted;
    }

    int choice = 0;
    if (!parse_int_strict(line, choice)) return ReviewSignal::Continue;
    if (choice < 0 || static_cast<size_t>(choice) > tracklist_.size()) {
        console_.print_line(kOutOfRange);
        return ReviewSignal::Continue;
    }

    auto& candidate = candidates_[selected_];
    candidate.match = ManualMatch{};
    if (choice == 0) {
        candidate.title.reset();
    } else {
        candidate.title = tracklist_[static_cast<size_t>(choice - 1)];
    }
    console_.print_line(describe_candidate(candidate, console_));
    state_ = ReviewState::Listing;
    return ReviewSignal::Continue;
}

void ReviewSession::display_tracklist() {
    console_.print_line("0 - <remove track title>");
    for (size_t i = 0; i < tracklist_.size(); ++i) {
        console_.print_line(std::to_string(i + 1) + " - " + tracklist_[i]);
    }
    console_.print_line("");
}

}  // namespace albumtag
