#ifndef LOADPLAN_PAIRWISE_ITERATOR
#define LOADPLAN_PAIRWISE_ITERATOR

#include <iterator>
#include <utility>

namespace loadplan {

// Walks the consecutive (previous, next) elements of a sequence, e.g. the
// legs of a route given its nodes.
template<typename ForwardIterator>
class pairwise_iterator
{
private:
  ForwardIterator mFirst;
  ForwardIterator mNext;

public:
  using reference = typename std::iterator_traits<ForwardIterator>::reference;
  using value_type = std::pair<reference, reference>;

  pairwise_iterator(ForwardIterator first, ForwardIterator last)
    : mFirst(first)
    , mNext(first == last ? first : std::next(first))
  {
  }

  auto operator!=(const pairwise_iterator& other) const -> bool
  {
    return mNext != other.mNext;
  }

  auto operator++() -> pairwise_iterator&
  {
    ++mFirst;
    ++mNext;
    return *this;
  }

  auto operator*() const -> value_type { return { *mFirst, *mNext }; }
};

template<typename ForwardIterator>
class pairwise_range
{
private:
  ForwardIterator mFirst;
  ForwardIterator mLast;

public:
  pairwise_range(ForwardIterator first, ForwardIterator last)
    : mFirst(first)
    , mLast(last)
  {
  }

  auto begin() const -> pairwise_iterator<ForwardIterator>
  {
    return { mFirst, mLast };
  }

  auto end() const -> pairwise_iterator<ForwardIterator>
  {
    return { mLast, mLast };
  }
};

template<typename C>
auto
make_pairwise_range(C& container) -> pairwise_range<decltype(container.begin())>
{
  return { container.begin(), container.end() };
}

} // namespace loadplan

#endif
