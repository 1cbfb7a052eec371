#include "remote/Source.hpp"
#include "log/Registry.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

using namespace mh::remote;
using namespace mh::log;

Listing Source::list(const std::string& root, const bool recursive) {
    return drain(listFolder(root, recursive));
}

Listing Source::changesSince(const std::string& cursor) {
    if (cursor.empty()) throw std::invalid_argument("changesSince requires a cursor");
    return drain(listContinue(cursor));
}

Listing Source::drain(Page first) {
    Listing out;
    out.entries = std::move(first.entries);
    out.cursor = std::move(first.cursor);

    unsigned int pages = 1;
    bool more = first.has_more;

    while (more) {
        if (out.cursor.empty()) throw std::runtime_error("Remote reported more entries but returned no cursor");

        auto page = listContinue(out.cursor);
        out.entries.insert(out.entries.end(),
                           std::make_move_iterator(page.entries.begin()),
                           std::make_move_iterator(page.entries.end()));
        out.cursor = std::move(page.cursor);
        more = page.has_more;
        ++pages;
    }

    Registry::remote()->debug("[{}] Listing drained: {} entries over {} page(s)", name(), out.entries.size(), pages);
    return out;
}
