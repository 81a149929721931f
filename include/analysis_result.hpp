#pragma once

#include <string>
#include <utility>

// Outcome of an analysis step. Expected absences are reported here instead of thrown.
enum class Outcome {
    Ok,            // Data was produced from a parsed document
    Empty,         // Input was empty (no content, no keyword); data holds zero values
    ParseFailure   // HTML could not be parsed; data comes from the degraded scanner path
};

inline std::string outcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::Ok: return "ok";
        case Outcome::Empty: return "empty";
        case Outcome::ParseFailure: return "parse_failure";
    }
    return "unknown";
}

// Result wrapper carrying an explicit outcome next to the data
template <typename T>
struct AnalysisResult {
    Outcome outcome = Outcome::Ok;
    T data{};

    AnalysisResult() = default;
    AnalysisResult(Outcome o, T d) : outcome(o), data(std::move(d)) {}

    bool succeeded() const { return outcome == Outcome::Ok; }
    bool empty() const { return outcome == Outcome::Empty; }
    bool degraded() const { return outcome == Outcome::ParseFailure; }
};
