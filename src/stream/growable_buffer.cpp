/*
 * 설명: 버퍼 크기 정책(유지, 압축, 기본 크기로 축소, 정확한 크기로 확장, 점진 확장)을 구현한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/growable_buffer_test.cpp
 */
#include "stream/growable_buffer.hpp"

#include <cstring>
#include <stdexcept>

namespace stream {

GrowableBuffer::GrowableBuffer(std::size_t default_capacity)
    : default_capacity_(default_capacity), start_(0), length_(0) {
    if (default_capacity == 0) {
        throw std::invalid_argument("버퍼 크기는 0보다 커야 함");
    }
    region_.resize(default_capacity);
}

ResizeAction GrowableBuffer::Reserve(std::size_t size) {
    if (size <= region_.size() - start_) {
        return ResizeAction::kNone;
    }

    if (size <= default_capacity_) {
        // 한 번 커졌던 버퍼는 기본 크기로 되돌려 메모리를 회수한다.
        if (region_.size() != default_capacity_) {
            Reallocate(default_capacity_);
            return ResizeAction::kShrunk;
        }
        Compact();
        return ResizeAction::kCompacted;
    }

    if (size <= region_.size()) {
        Compact();
        return ResizeAction::kCompacted;
    }

    Reallocate(size);
    return ResizeAction::kGrown;
}

ResizeAction GrowableBuffer::MakeRoom(std::size_t increment) {
    if (start_ + length_ < region_.size()) {
        return ResizeAction::kNone;
    }
    if (start_ > 0) {
        Compact();
        return ResizeAction::kCompacted;
    }
    Reallocate(region_.size() + increment);
    return ResizeAction::kGrown;
}

void GrowableBuffer::CommitWrite(std::size_t count) {
    if (count > WritableSize()) {
        throw std::logic_error("버퍼 쓰기 범위 초과");
    }
    length_ += count;
}

void GrowableBuffer::Consume(std::size_t count) {
    if (count > length_) {
        throw std::logic_error("버퍼 소비 범위 초과");
    }
    start_ += count;
    length_ -= count;
}

void GrowableBuffer::Compact() {
    if (start_ == 0) {
        return;
    }
    if (length_ > 0) {
        std::memmove(&region_[0], &region_[0] + start_, length_);
    }
    start_ = 0;
}

void GrowableBuffer::Reallocate(std::size_t capacity) {
    std::vector<unsigned char> region(capacity);
    if (length_ > 0) {
        std::memcpy(&region[0], &region_[0] + start_, length_);
    }
    region_.swap(region);
    start_ = 0;
}

std::string ResizeActionToString(ResizeAction action) {
    switch (action) {
        case ResizeAction::kNone:
            return "none";
        case ResizeAction::kCompacted:
            return "compacted";
        case ResizeAction::kShrunk:
            return "shrunk";
        case ResizeAction::kGrown:
            return "grown";
    }
    return "none";
}

}  // namespace stream
