#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "menukit/core/Types.hpp"

namespace menukit::core {

// Previous/next links between entries of a list, stored as indices so that
// the list owns its entries and the links never dangle.
class NavigationRing {
public:
    NavigationRing() = default;
    explicit NavigationRing(std::size_t count) : links_(count) {}

    std::size_t size() const noexcept { return links_.size(); }
    bool empty() const noexcept { return links_.empty(); }

    // Appends an unlinked entry and returns its index.
    std::size_t Append();

    // Makes `to` the next of `from` and `from` the previous of `to`. Links
    // previously held by either end on the rewired side are cut on both ends.
    bool Link(std::size_t from, std::size_t to);
    // Links every entry to its successor in index order, closing the ring when
    // `wrap` is set.
    void LinkChain(bool wrap);
    void Unlink(std::size_t index);

    std::optional<std::size_t> previous(std::size_t index) const;
    std::optional<std::size_t> next(std::size_t index) const;

private:
    struct Links {
        std::optional<std::size_t> previous;
        std::optional<std::size_t> next;
    };

    bool Valid(std::size_t index) const noexcept { return index < links_.size(); }

    std::vector<Links> links_;
};

// Top edges for a column of items stacked with `spacing` pixels between them
// and centered, as a block, inside `area`. Each item is also centered
// horizontally; the result holds top-left corners.
std::vector<Point> StackCentered(const Rect& area, const std::vector<Size>& sizes, int spacing = 0);

}  // namespace menukit::core
