#include "database_impl.h"
#include "utils/expect.h"

namespace Birch {

DatabaseImpl::DatabaseImpl(const Options &options, std::unique_ptr<PageStore> owned, PageStore &store)
    : m_system {options},
      m_log {m_system.create_log("database")},
      m_store_log {m_system.create_log("store")},
      m_owned_store {std::move(owned)},
      m_store {&store}
{
    m_log->info("opened database with page size {} ({} store)", m_store->page_size(), m_owned_store ? "in-memory" : "external");
}

DatabaseImpl::~DatabaseImpl()
{
    BIRCH_EXPECT_FALSE(m_has_writer);
    BIRCH_EXPECT_TRUE(m_readers.empty());
    m_log->info("closed database at version {}", m_store->version());
}

auto DatabaseImpl::begin_write(std::unique_ptr<WriteTransaction> &out) -> Status
{
    std::unique_ptr<WriteTransaction> txn;
    {
        std::lock_guard lock {m_mutex};
        if (m_has_writer)
            return Status::logic_error("a write transaction is already live");

        // Pages freed by commits that no live reader predates can be reused.
        const auto oldest = m_readers.empty() ? m_store->version() : *begin(m_readers);
        if (const auto n = m_store->reclaim(oldest))
            m_store_log->trace("reclaimed {} pages freed at or before version {}", n, oldest);

        txn.reset(new WriteTransaction {*this, m_directory});
        m_has_writer = true;
        m_log->trace("began write transaction after version {}", m_store->version());
    }
    // The transaction being replaced, if any, may need the lock to finish.
    out = std::move(txn);
    return Status::ok();
}

auto DatabaseImpl::begin_read(std::unique_ptr<ReadTransaction> &out) -> Status
{
    std::unique_ptr<ReadTransaction> txn;
    {
        std::lock_guard lock {m_mutex};
        const auto version = m_store->version();
        m_readers.insert(version);
        txn.reset(new ReadTransaction {*this, m_directory, version});
        m_log->trace("began read transaction at version {}", version);
    }
    out = std::move(txn);
    return Status::ok();
}

auto DatabaseImpl::commit_write(const std::vector<PageNumber> &freed, std::optional<RootPointer> directory, Size &version) -> Status
{
    std::lock_guard lock {m_mutex};
    BIRCH_EXPECT_TRUE(m_has_writer);
    for (const auto &id: freed)
        m_store->mark_freed(id);

    if (auto s = m_store->commit(version); !s.is_ok()) {
        m_log->error("cannot commit: {}", s.what().to_string());
        return s;
    }
    m_directory = directory;
    m_has_writer = false;
    m_log->info("committed version {} ({} freed pages)", version, freed.size());
    return Status::ok();
}

auto DatabaseImpl::abort_write() -> void
{
    std::lock_guard lock {m_mutex};
    BIRCH_EXPECT_TRUE(m_has_writer);
    m_store->rollback();
    m_has_writer = false;
    m_log->info("aborted write transaction (last commit was version {})", m_store->version());
}

auto DatabaseImpl::end_read(Size version) -> void
{
    std::lock_guard lock {m_mutex};
    const auto itr = m_readers.find(version);
    BIRCH_EXPECT_NE(itr, end(m_readers));
    m_readers.erase(itr);
    m_log->trace("ended read transaction at version {}", version);
}

} // namespace Birch
