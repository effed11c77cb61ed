#include <folio/layout/regions.h>

#include <sstream>

namespace folio::layout {

Regions Regions::repeat(Size size, Axes<bool> expand) {
    Regions regions;
    regions.size = size;
    regions.expand = expand;
    regions.full = size.height;
    regions.last = size.height;
    return regions;
}

void Regions::next() {
    std::optional<float> height;
    if (!backlog.empty()) {
        height = backlog.front();
        backlog.erase(backlog.begin());
    } else {
        height = last;
    }
    if (height) {
        size.height = *height;
        full = *height;
    }
}

std::vector<Size> Regions::iter(std::size_t count) const {
    std::vector<Size> sizes;
    if (count == 0) return sizes;
    sizes.push_back(size);
    for (float height : backlog) {
        if (sizes.size() == count) return sizes;
        sizes.emplace_back(size.width, height);
    }
    while (last && sizes.size() < count) {
        sizes.emplace_back(size.width, *last);
    }
    return sizes;
}

std::string describe_regions(const Regions& regions) {
    std::ostringstream out;
    out << "Regions [" << regions.size.width << "x" << regions.size.height;
    float prev = regions.size.height;
    for (float height : regions.backlog) {
        out << ", " << regions.size.width << "x" << height;
        prev = height;
    }
    if (regions.last) {
        if (*regions.last != prev) {
            out << ", " << regions.size.width << "x" << *regions.last;
        }
        out << ", ..";
    }
    out << "]";
    return out.str();
}

} // namespace folio::layout
