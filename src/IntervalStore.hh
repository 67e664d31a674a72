#pragma once

#include <stddef.h>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace NeutopiaRando {

// Accumulates half-open [start, end) ranges, merging ranges that overlap or
// touch. Used to check that the room data we parsed covers the ROM regions we
// think it does. This is a linear scan on every add; the stores hold a few
// hundred intervals at most.
template <typename T>
class IntervalStore {
public:
  struct Interval {
    T start; // Inclusive
    T end; // Exclusive

    bool can_merge(const Interval& other) const {
      return ((this->start <= other.start) && (other.start <= this->end)) ||
          ((other.start <= this->start) && (this->start <= other.end));
    }
    bool overlaps(const Interval& other) const {
      return (this->start < other.end) && (other.start < this->end);
    }
    void merge(const Interval& other) {
      if (!this->can_merge(other)) {
        throw std::logic_error("attempted to merge disjoint intervals");
      }
      this->start = std::min(this->start, other.start);
      this->end = std::max(this->end, other.end);
    }

    bool operator==(const Interval& other) const {
      return (this->start == other.start) && (this->end == other.end);
    }
    bool operator<(const Interval& other) const {
      return (this->start < other.start) ||
          ((this->start == other.start) && (this->end < other.end));
    }
  };

  IntervalStore() = default;
  ~IntervalStore() = default;

  void add(T start, T end) {
    Interval new_interval{start, end};
    size_t first_match = this->intervals.size();
    size_t z = 0;
    while (z < this->intervals.size()) {
      const Interval& existing = this->intervals[z];
      if (existing.overlaps(new_interval)) {
        this->num_overlaps++;
      }
      if (first_match == this->intervals.size() && existing.can_merge(new_interval)) {
        this->intervals[z].merge(new_interval);
        new_interval = this->intervals[z];
        first_match = z;
        z++;
      } else if (first_match != this->intervals.size() && existing.can_merge(new_interval)) {
        this->intervals[first_match].merge(existing);
        new_interval = this->intervals[first_match];
        this->intervals.erase(this->intervals.begin() + z);
      } else {
        z++;
      }
    }
    if (first_match == this->intervals.size()) {
      this->intervals.emplace_back(new_interval);
    }
  }

  std::vector<Interval> get_intervals() const {
    auto ret = this->intervals;
    std::sort(ret.begin(), ret.end());
    return ret;
  }

  // Returns the uncovered ranges between the first and last intervals.
  std::vector<Interval> get_gaps() const {
    auto sorted = this->get_intervals();
    std::vector<Interval> ret;
    for (size_t z = 1; z < sorted.size(); z++) {
      ret.emplace_back(Interval{sorted[z - 1].end, sorted[z].start});
    }
    return ret;
  }

  // Number of adds that claimed bytes already claimed by an earlier add.
  // Adjacent ranges don't count.
  inline size_t overlap_count() const {
    return this->num_overlaps;
  }

  inline bool empty() const {
    return this->intervals.empty();
  }

private:
  std::vector<Interval> intervals;
  size_t num_overlaps = 0;
};

} // namespace NeutopiaRando
