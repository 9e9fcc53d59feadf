#pragma once

// Album metadata tagger
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <cstddef>
#include <string>
#include <vector>

#include "albumtag/console.h"
#include "albumtag/matching.h"

namespace albumtag {

/** One line describing where a candidate's file name leads. */
std::string describe_candidate(
    const TrackCandidate& candidate,
    const Console& console);

/** Numbered listing of all candidates, starting at 1. */
void display_match_summary(
    const std::vector<TrackCandidate>& candidates,
    Console& console);

enum class ReviewState {
    Listing,
    AwaitingSelection,
    AwaitingTitleChoice,
    Committed,
    Aborted,
};

/** Result of one review step. */
enum class ReviewSignal {
    Continue,
    Cancelled,
    Committed,
    Aborted,
};

/**
 * Operator review of automatic matches.
 *
 * Listing shows all candidates and moves to AwaitingSelection. There an
 * empty line commits, "q" aborts and a number 1..N opens AwaitingTitleChoice
 * for that candidate. In AwaitingTitleChoice an empty line cancels back to
 * Listing, "q" aborts, 0 clears the title and 1..M picks a tracklist title.
 * Other input is asked again; out of range numbers print an error first.
 */
class ReviewSession {
public:
    ReviewSession(
        std::vector<TrackCandidate> candidates,
        std::vector<std::string> tracklist,
        Console& console);

    ReviewState state() const { return state_; }
    const std::vector<TrackCandidate>& candidates() const { return candidates_; }
    /** Candidate being edited in AwaitingTitleChoice. */
    size_t selected() const { return selected_; }

    /** Prompt text for the current state, empty when no input is awaited. */
    std::string prompt() const;

    /**
     * Advance once: render a listing, or read one line and handle it.
     * End of input aborts.
     */
    ReviewSignal step();

    /** Handle one line of operator input in the current state. */
    ReviewSignal handle_input(const std::string& line);

    /** Step until Committed or Aborted. */
    ReviewSignal run();

private:
    ReviewSignal handle_selection(const std::string& line);
    ReviewSignal handle_title_choice(const std::string& line);
    void display_tracklist();

    std::vector<TrackCandidate> candidates_;
    std::vector<std::string> tracklist_;
    Console& console_;
    ReviewState state_{ReviewState::Listing};
    size_t selected_{0};
};

}  // namespace albumtag
