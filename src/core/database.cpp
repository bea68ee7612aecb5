#include "birch/memory_store.h"
#include "database_impl.h"
#include "utils/utils.h"

namespace Birch {

Database::Database(std::unique_ptr<DatabaseImpl> impl)
    : m_impl {std::move(impl)}
{}

Database::~Database() = default;

auto Database::open(const Options &options, std::unique_ptr<Database> &out) -> Status
{
    BIRCH_TRY_S(validate_options(options));
    if (options.store && options.store->page_size() != options.page_size)
        return Status::invalid_argument("page size does not match the page store");

    std::unique_ptr<PageStore> owned;
    auto *store = options.store;
    if (store == nullptr) {
        owned = std::make_unique<MemoryStore>(options.page_size);
        store = owned.get();
    }

    std::unique_ptr<DatabaseImpl> impl;
    try {
        impl = std::make_unique<DatabaseImpl>(options, std::move(owned), *store);
    } catch (const spdlog::spdlog_ex &error) {
        return Status::system_error(error.what());
    }
    out.reset(new Database {std::move(impl)});
    return Status::ok();
}

auto Database::begin_write(std::unique_ptr<WriteTransaction> &out) -> Status
{
    return m_impl->begin_write(out);
}

auto Database::begin_read(std::unique_ptr<ReadTransaction> &out) -> Status
{
    return m_impl->begin_read(out);
}

auto Database::page_size() const -> Size
{
    return m_impl->store().page_size();
}

} // namespace Birch
