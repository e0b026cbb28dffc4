/*
 * 설명: 여러 구분자를 동시에 찾고, 조각난 입력에서도 확정된 가장 앞선 일치만 승자로 고른다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/delimiter_matcher_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stream {

/*
 * 가장 앞선 시작 위치가 항상 이긴다. 같은 위치에서 시작하는 구분자끼리는
 *  - kEarliestWins: 목록에서 먼저 나온 구분자
 *  - kShortestAtTie: 가장 짧은 구분자
 *  - kLongestAtTie: 가장 긴 구분자
 * 가 이긴다. 길이가 같으면 목록 순서를 따른다.
 */
enum class DelimiterMatchingMode { kEarliestWins = 0, kShortestAtTie = 1, kLongestAtTie = 2 };

struct DelimiterMatch {
    std::size_t offset;
    std::size_t delimiter_index;
    std::size_t delimiter_length;

    DelimiterMatch() : offset(0), delimiter_index(0), delimiter_length(0) {}
    DelimiterMatch(std::size_t at, std::size_t index, std::size_t length)
        : offset(at), delimiter_index(index), delimiter_length(length) {}
};

class DelimiterMatcher {
   public:
    // 빈 문자열 구분자는 std::invalid_argument.
    DelimiterMatcher(const std::vector<std::string> &delimiters, DelimiterMatchingMode mode);

    bool Empty() const { return delimiters_.empty(); }
    std::size_t MinLength() const { return min_length_; }
    std::size_t MaxLength() const { return max_length_; }

    /*
     * window[search_offset, length) 구간의 각 위치에서 아직 일치하지 않은 구분자를 비교한다.
     * 끝까지 들어맞는 구분자만 후보로 기록하고, window 끝에 걸친 접두사는 대기 상태로 남긴다.
     */
    void Scan(const unsigned char *window, std::size_t length, std::size_t search_offset);

    // 더 읽어도 결과가 바뀌지 않을 때만 승자를 돌려준다.
    bool DefinitiveMatch(const unsigned char *window, std::size_t length, DelimiterMatch &out) const;

    // 데이터 끝에서 후보 중 최선을 고른다.
    bool BestMatch(DelimiterMatch &out) const;

    const std::vector<DelimiterMatch> &candidates() const { return candidates_; }
    std::size_t pending_count() const { return unmatched_.size(); }

   private:
    bool Beats(const DelimiterMatch &challenger, const DelimiterMatch &current) const;

    const std::vector<std::string> &delimiters_;
    DelimiterMatchingMode mode_;
    std::size_t min_length_;
    std::size_t max_length_;
    std::vector<std::size_t> unmatched_;
    std::vector<DelimiterMatch> candidates_;
};

std::string DelimiterMatchingModeToString(DelimiterMatchingMode mode);
bool ParseDelimiterMatchingMode(const std::string &raw, DelimiterMatchingMode &out);

}  // namespace stream
