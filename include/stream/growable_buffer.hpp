/*
 * 설명: 하나의 연속 메모리 영역과 그 안의 유효 구간(window)을 관리한다.
 *       압축(compaction)과 재할당은 Reserve/MakeRoom 두 진입점에서만 일어난다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/growable_buffer_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stream {

enum class ResizeAction { kNone = 0, kCompacted = 1, kShrunk = 2, kGrown = 3 };

class GrowableBuffer {
   public:
    explicit GrowableBuffer(std::size_t default_capacity);

    /*
     * window 시작점부터 size 바이트를 담을 수 있게 한다.
     * 기본 크기로 충분하면 기본 크기로 되돌아가고, 모자라면 정확히 size 만큼만 할당한다.
     */
    ResizeAction Reserve(std::size_t size);

    // 영역이 가득 찼을 때 앞쪽 여유를 회수하거나, 없으면 increment 만큼 키운다.
    ResizeAction MakeRoom(std::size_t increment);

    const unsigned char *Data() const { return &region_[0] + start_; }
    std::size_t Size() const { return length_; }
    std::size_t Start() const { return start_; }
    std::size_t Capacity() const { return region_.size(); }
    std::size_t DefaultCapacity() const { return default_capacity_; }

    unsigned char *WritePtr() { return &region_[0] + start_ + length_; }
    std::size_t WritableSize() const { return region_.size() - (start_ + length_); }
    void CommitWrite(std::size_t count);

    void Consume(std::size_t count);

   private:
    void Compact();
    void Reallocate(std::size_t capacity);

    std::vector<unsigned char> region_;
    std::size_t default_capacity_;
    std::size_t start_;
    std::size_t length_;
};

std::string ResizeActionToString(ResizeAction action);

}  // namespace stream
