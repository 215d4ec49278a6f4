#include "menukit/core/Navigation.hpp"

namespace menukit::core {

std::size_t NavigationRing::Append() {
    links_.emplace_back();
    return links_.size() - 1;
}

bool NavigationRing::Link(std::size_t from, std::size_t to) {
    if (!Valid(from) || !Valid(to)) {
        return false;
    }
    if (auto old_next = links_[from].next) {
        links_[*old_next].previous.reset();
    }
    if (auto old_previous = links_[to].previous) {
        links_[*old_previous].next.reset();
    }
    links_[from].next = to;
    links_[to].previous = from;
    return true;
}

void NavigationRing::LinkChain(bool wrap) {
    for (std::size_t i = 0; i + 1 < links_.size(); ++i) {
        Link(i, i + 1);
    }
    if (wrap && links_.size() > 1) {
        Link(links_.size() - 1, 0);
    }
}

void NavigationRing::Unlink(std::size_t index) {
    if (!Valid(index)) {
        return;
    }
    if (auto previous = links_[index].previous) {
        links_[*previous].next.reset();
    }
    if (auto next = links_[index].next) {
        links_[*next].previous.reset();
    }
    links_[index] = Links{};
}

std::optional<std::size_t> NavigationRing::previous(std::size_t index) const {
    if (!Valid(index)) {
        return std::nullopt;
    }
    return links_[index].previous;
}

std::optional<std::size_t> NavigationRing::next(std::size_t index) const {
    if (!Valid(index)) {
        return std::nullopt;
    }
    return links_[index].next;
}

std::vector<Point> StackCentered(const Rect& area, const std::vector<Size>& sizes, int spacing) {
    std::vector<Point> result;
    result.reserve(sizes.size());
    int total_height = 0;
    for (const auto& size : sizes) {
        total_height += size.h;
    }
    if (!sizes.empty()) {
        total_height += spacing * static_cast<int>(sizes.size() - 1);
    }
    int cursor = area.y + (area.h - total_height) / 2;
    for (const auto& size : sizes) {
        result.push_back(Point{area.x + (area.w - size.w) / 2, cursor});
        cursor += size.h + spacing;
    }
    return result;
}

}  // namespace menukit::core
