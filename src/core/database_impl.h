#ifndef BIRCH_CORE_DATABASE_IMPL_H
#define BIRCH_CORE_DATABASE_IMPL_H

#include <mutex>
#include <set>
#include "birch/database.h"
#include "utils/system.h"

namespace Birch {

/*
 * State shared by a database and its transactions: the page store, the committed directory root,
 * the versions pinned by live readers, and whether a writer is live.
 */
class DatabaseImpl final {
public:
    DatabaseImpl(const Options &options, std::unique_ptr<PageStore> owned, PageStore &store);
    ~DatabaseImpl();

    [[nodiscard]]
    auto store() const -> PageStore &
    {
        return *m_store;
    }

    [[nodiscard]]
    auto log() const -> const LogPtr &
    {
        return m_log;
    }

    [[nodiscard]] auto begin_write(std::unique_ptr<WriteTransaction> &out) -> Status;
    [[nodiscard]] auto begin_read(std::unique_ptr<ReadTransaction> &out) -> Status;

    // Publish the freed pages and the new directory root of the live writer, and end it.
    [[nodiscard]] auto commit_write(const std::vector<PageNumber> &freed, std::optional<RootPointer> directory, Size &version) -> Status;

    // Discard everything the live writer did, and end it.
    auto abort_write() -> void;

    auto end_read(Size version) -> void;

private:
    mutable std::mutex m_mutex;
    System m_system;
    LogPtr m_log;
    LogPtr m_store_log;
    std::unique_ptr<PageStore> m_owned_store;
    PageStore *m_store {};
    std::optional<RootPointer> m_directory;
    std::multiset<Size> m_readers;
    bool m_has_writer {};
};

} // namespace Birch

#endif // BIRCH_CORE_DATABASE_IMPL_H
