/**
 * @file TextNormalizer.cpp
 * @brief Implementation of TextNormalizer.
 */

#include "application/TextNormalizer.hpp"
#include <algorithm>
#include <cctype>

namespace ledgerlens::application {

namespace {

std::string CollapseWhitespace(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    bool prevSpace = true;
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            if (!prevSpace) {
                out.push_back(' ');
                prevSpace = true;
            }
        } else {
            out.push_back(ch);
            prevSpace = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

} // namespace

std::string TextNormalizer::canonicalText(const std::string& transcription,
                                          const std::string& vendor,
                                          const std::string& description) {
    std::string out;
    for (const std::string* part : {&transcription, &vendor, &description}) {
        std::string cleaned = CollapseWhitespace(*part);
        if (cleaned.empty()) continue;
        if (!out.empty()) out.push_back(' ');
        out += cleaned;
    }
    return out;
}

std::string TextNormalizer::canonicalText(const domain::ExpenseRecord& expense) {
    return canonicalText(expense.transcription, expense.vendor, expense.description);
}

std::string TextNormalizer::canonicalText(const domain::CandidateExpense& candidate) {
    return canonicalText(candidate.transcription, candidate.vendor, candidate.description);
}

std::string TextNormalizer::canonicalTerm(const std::string& value) {
    return toLower(CollapseWhitespace(value));
}

std::string TextNormalizer::toLower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string TextNormalizer::trim(const std::string& value) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(value.begin(), value.end(), notSpace);
    auto end = std::find_if(value.rbegin(), value.rend(), notSpace).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

} // namespace ledgerlens::application
