/*
 * 설명: 다중 구분자 탐색과 매칭 모드별 승자 판정을 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/delimiter_matcher_test.cpp
 */
#include "stream/delimiter_matcher.hpp"

#include <cstring>
#include <stdexcept>

namespace stream {

DelimiterMatcher::DelimiterMatcher(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode)
    : delimiters_(delimiters), mode_(mode), min_length_(0), max_length_(0) {
    for (std::size_t i = 0; i < delimiters.size(); ++i) {
        std::size_t length = delimiters[i].size();
        if (length == 0) {
            throw std::invalid_argument("빈 구분자는 허용되지 않음");
        }
        if (i == 0 || length < min_length_) {
            min_length_ = length;
        }
        if (length > max_length_) {
            max_length_ = length;
        }
        unmatched_.push_back(i);
    }
}

void DelimiterMatcher::Scan(const unsigned char *window, std::size_t length, std::size_t search_offset) {
    DelimiterMatch best;
    bool has_best = BestMatch(best);

    for (std::size_t pos = search_offset; pos < length && !unmatched_.empty(); ++pos) {
        // 이미 확정된 후보보다 뒤에서 시작하는 일치는 이길 수 없다.
        if (has_best && pos > best.offset) {
            break;
        }
        if (length - pos < min_length_) {
            break;
        }

        std::size_t i = 0;
        while (i < unmatched_.size()) {
            const std::string &delimiter = delimiters_[unmatched_[i]];
            if (delimiter.size() <= length - pos &&
                std::memcmp(window + pos, delimiter.data(), delimiter.size()) == 0) {
                DelimiterMatch match(pos, unmatched_[i], delimiter.size());
                candidates_.push_back(match);
                if (!has_best || Beats(match, best)) {
                    best = match;
                    has_best = true;
                }
                unmatched_.erase(unmatched_.begin() + static_cast<std::ptrdiff_t>(i));
                continue;
            }
            ++i;
        }
    }
}

bool DelimiterMatcher::DefinitiveMatch(const unsigned char *window, std::size_t length,
                                       DelimiterMatch &out) const {
    DelimiterMatch best;
    if (!BestMatch(best)) {
        return false;
    }

    for (std::size_t i = 0; i < unmatched_.size(); ++i) {
        const std::string &delimiter = delimiters_[unmatched_[i]];
        // 완전히 들어갈 수 있던 위치는 이미 검사가 끝났다. 끝에 걸친 접두사만 확인한다.
        std::size_t first = length >= delimiter.size() ? length - delimiter.size() + 1 : 0;
        for (std::size_t pos = first; pos <= best.offset && pos < length; ++pos) {
            if (std::memcmp(window + pos, delimiter.data(), length - pos) != 0) {
                continue;
            }
            if (pos < best.offset) {
                return false;
            }
            if (Beats(DelimiterMatch(pos, unmatched_[i], delimiter.size()), best)) {
                return false;
            }
        }
    }

    out = best;
    return true;
}

bool DelimiterMatcher::BestMatch(DelimiterMatch &out) const {
    if (candidates_.empty()) {
        return false;
    }
    DelimiterMatch best = candidates_[0];
    for (std::size_t i = 1; i < candidates_.size(); ++i) {
        const DelimiterMatch &candidate = candidates_[i];
        if (candidate.offset < best.offset ||
            (candidate.offset == best.offset && Beats(candidate, best))) {
            best = candidate;
        }
    }
    out = best;
    return true;
}

bool DelimiterMatcher::Beats(const DelimiterMatch &challenger, const DelimiterMatch &current) const {
    if (challenger.offset != current.offset) {
        return challenger.offset < current.offset;
    }
    switch (mode_) {
        case DelimiterMatchingMode::kEarliestWins:
            break;
        case DelimiterMatchingMode::kShortestAtTie:
            if (challenger.delimiter_length != current.delimiter_length) {
                return challenger.delimiter_length < current.delimiter_length;
            }
            break;
        case DelimiterMatchingMode::kLongestAtTie:
            if (challenger.delimiter_length != current.delimiter_length) {
                return challenger.delimiter_length > current.delimiter_length;
            }
            break;
    }
    return challenger.delimiter_index < current.delimiter_index;
}

std::string DelimiterMatchingModeToString(DelimiterMatchingMode mode) {
    switch (mode) {
        case DelimiterMatchingMode::kEarliestWins:
            return "earliest";
        case DelimiterMatchingMode::kShortestAtTie:
            return "shortest";
        case DelimiterMatchingMode::kLongestAtTie:
            return "longest";
    }
    return "earliest";
}

bool ParseDelimiterMatchingMode(const std::string &raw, DelimiterMatchingMode &out) {
    if (raw == "earliest") {
        out = DelimiterMatchingMode::kEarliestWins;
        return true;
    }
    if (raw == "shortest") {
        out = DelimiterMatchingMode::kShortestAtTie;
        return true;
    }
    if (raw == "longest") {
        out = DelimiterMatchingMode::kLongestAtTie;
        return true;
    }
    return false;
}

}  // namespace stream
