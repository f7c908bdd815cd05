#include "coldstash/storage/pagination.hpp"

namespace coldstash {

ListResult collect_all_pages(const Context& ctx, const PageFetcher& fetch) {
    ListResult result;
    std::string cursor;
    size_t pages = 0;

    while (true) {
        if (ctx.cancelled()) {
            result.names.clear();
            result.status = Status::error(ErrorCode::Cancelled, "listing cancelled");
            return result;
        }

        Page page = fetch(cursor);
        ++pages;
        if (!page.status.ok()) {
            result.names.clear();
            result.status = page.status;
            return result;
        }

        result.names.insert(result.names.end(),
                            std::make_move_iterator(page.names.begin()),
                            std::make_move_iterator(page.names.end()));

        if (!page.truncated) break;

        if (page.next_cursor.empty()) {
            result.names.clear();
            result.status = Status::error(ErrorCode::Provider,
                                          "listing page " + std::to_string(pages) +
                                          " is truncated but has no continuation token");
            return result;
        }
        cursor = std::move(page.next_cursor);
    }

    return result;
}

} // namespace coldstash
