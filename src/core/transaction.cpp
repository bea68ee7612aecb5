#include "birch/transaction.h"
#include "database_impl.h"
#include "utils/encoding.h"
#include "utils/expect.h"

namespace Birch {

/* Table Record Format:
 *     Offset  Size    Name
 *    ------------------------------
 *     0       1       Has root (0 or 1)
 *     1       8       Root page number
 *     9       4       Root checksum
 *     13      2       Key type name length (N)
 *     15      N       Key type name
 *     15+N    *       Value type name
 */
static constexpr Size TABLE_RECORD_HEADER_SIZE {15};

static auto encode_record(const TableRecord &record) -> std::string
{
    std::string out;
    out.push_back(record.root ? '\x01' : '\x00');
    append_u64(out, record.root ? record.root->page.value : 0);
    append_u32(out, record.root ? record.root->checksum : 0);
    append_u16(out, static_cast<std::uint16_t>(record.key_type.size()));
    out += record.key_type;
    out += record.value_type;
    return out;
}

static auto decode_record(const Slice &in, TableRecord &out) -> Status
{
    if (in.size() < TABLE_RECORD_HEADER_SIZE)
        return Status::corruption("table record is too small");
    const auto key_type_size = get_u16(in.data() + 13);
    if (TABLE_RECORD_HEADER_SIZE + key_type_size > in.size())
        return Status::corruption("table record type name is out of bounds");

    out.root.reset();
    if (in[0] != '\x00')
        out.root = RootPointer {PageNumber {get_u64(in.data() + 1)}, get_u32(in.data() + 9)};
    out.key_type = in.range(TABLE_RECORD_HEADER_SIZE, key_type_size).to_string();
    out.value_type = in.range(TABLE_RECORD_HEADER_SIZE + key_type_size).to_string();
    return Status::ok();
}

static auto check_types(const std::string &name, const TableRecord &record, const std::string &key_type, const std::string &value_type) -> Status
{
    if (record.key_type != key_type || record.value_type != value_type) {
        return Status::type_mismatch("table \"" + name + "\" stores <" + record.key_type + ", " + record.value_type +
                                     ">, not <" + key_type + ", " + value_type + ">");
    }
    return Status::ok();
}

static auto read_names(EntryCursor &cursor, std::set<std::string> &out) -> Status
{
    while (auto entry = cursor.next())
        out.insert(entry->key.bytes().to_string());
    return cursor.status();
}

WriteTransaction::WriteTransaction(DatabaseImpl &impl, std::optional<RootPointer> directory)
    : m_directory {std::make_unique<BTreeMut>(directory, impl.store(), m_freed, &Codec<std::string>::compare)},
      m_impl {&impl}
{}

WriteTransaction::~WriteTransaction()
{
    // Tables hold a pointer back to the transaction that opened them.
    BIRCH_EXPECT_TRUE(m_open.empty());
    if (!m_is_finished)
        rollback();
}

auto WriteTransaction::lookup(const std::string &name, std::optional<TableRecord> &out) const -> Status
{
    out.reset();
    if (const auto itr = m_pending.find(name); itr != end(m_pending)) {
        out = itr->second;
        return Status::ok();
    }
    std::optional<ByteGuard> bytes;
    BIRCH_TRY_S(m_directory->get(name, bytes));
    if (bytes) {
        TableRecord record;
        BIRCH_TRY_S(decode_record(bytes->bytes(), record));
        out = std::move(record);
    }
    return Status::ok();
}

auto WriteTransaction::open_tree(const std::string &name, const std::string &key_type, const std::string &value_type, Comparator cmp, std::unique_ptr<BTreeMut> &out) -> Status
{
    if (m_is_finished)
        return Status::logic_error("transaction is finished");
    if (m_open.find(name) != end(m_open))
        return Status::table_already_open("table \"" + name + "\" is already open");

    std::optional<TableRecord> record;
    BIRCH_TRY_S(lookup(name, record));
    if (record) {
        BIRCH_TRY_S(check_types(name, *record, key_type, value_type));
    } else {
        record = TableRecord {std::nullopt, key_type, value_type};
        m_impl->log()->trace("creating table \"{}\"", name);
    }
    out = std::make_unique<BTreeMut>(record->root, m_impl->store(), m_freed, cmp);
    m_pending[name] = std::move(record);
    m_open.insert(name);
    return Status::ok();
}

auto WriteTransaction::close_table(const std::string &name, BTreeMut &tree) -> void
{
    m_open.erase(name);
    if (m_is_finished)
        return;

    if (auto s = tree.finalize_dirty_checksums(); !s.is_ok()) {
        m_impl->log()->error("cannot close table \"{}\": {}", name, s.what().to_string());
        if (m_status.is_ok())
            m_status = s;
        return;
    }
    auto &record = m_pending[name];
    BIRCH_EXPECT_TRUE(record.has_value());
    record->root = tree.root();
    if (record->root) {
        m_impl->log()->trace("closed table \"{}\" with root {}", name, record->root->page.value);
    } else {
        m_impl->log()->trace("closed table \"{}\" (empty)", name);
    }
}

auto WriteTransaction::delete_table(const std::string &name, bool &existed) -> Status
{
    existed = false;
    if (m_is_finished)
        return Status::logic_error("transaction is finished");
    if (m_open.find(name) != end(m_open))
        return Status::table_already_open("table \"" + name + "\" is open");

    std::optional<TableRecord> record;
    BIRCH_TRY_S(lookup(name, record));
    if (!record)
        return Status::ok();

    if (record->root) {
        std::vector<PageNumber> pages;
        const BTree tree {record->root, PageHint::NONE, m_impl->store(), &Codec<std::string>::compare};
        BIRCH_TRY_S(tree.collect_pages(pages));
        for (const auto &id: pages) {
            if (m_impl->store().is_uncommitted(id)) {
                m_impl->store().free_page(id);
            } else {
                m_freed.emplace_back(id);
            }
        }
    }
    m_pending[name] = std::nullopt;
    existed = true;
    m_impl->log()->trace("deleted table \"{}\"", name);
    return Status::ok();
}

auto WriteTransaction::list_tables(std::vector<std::string> &out) const -> Status
{
    out.clear();
    std::set<std::string> names;
    auto cursor = m_directory->range(ByteRange {});
    BIRCH_TRY_S(read_names(*cursor, names));
    for (const auto &[name, record]: m_pending) {
        if (record) {
            names.insert(name);
        } else {
            names.erase(name);
        }
    }
    out.assign(begin(names), end(names));
    return Status::ok();
}

auto WriteTransaction::commit() -> Status
{
    if (m_is_finished)
        return Status::logic_error("transaction is finished");
    if (!m_status.is_ok())
        return m_status;
    if (!m_open.empty())
        return Status::logic_error("cannot commit while tables are open");

    for (const auto &[name, record]: m_pending) {
        std::optional<ByteGuard> old;
        if (record) {
            BIRCH_TRY_S(m_directory->insert(name, encode_record(*record), old));
        } else {
            BIRCH_TRY_S(m_directory->remove(name, old));
        }
    }
    BIRCH_TRY_S(m_directory->finalize_dirty_checksums());

    Size version {};
    BIRCH_TRY_S(m_impl->commit_write(m_freed, m_directory->root(), version));
    m_is_finished = true;
    m_pending.clear();
    m_freed.clear();
    return Status::ok();
}

auto WriteTransaction::abort() -> Status
{
    if (m_is_finished)
        return Status::logic_error("transaction is finished");
    rollback();
    return Status::ok();
}

auto WriteTransaction::rollback() -> void
{
    m_impl->abort_write();
    m_is_finished = true;
    m_pending.clear();
    m_freed.clear();
}

ReadTransaction::ReadTransaction(DatabaseImpl &impl, std::optional<RootPointer> directory, Size version)
    : m_directory {directory},
      m_version {version},
      m_impl {&impl}
{}

ReadTransaction::~ReadTransaction()
{
    m_impl->end_read(m_version);
}

auto ReadTransaction::store() const -> PageStore &
{
    return m_impl->store();
}

auto ReadTransaction::open_tree(const std::string &name, const std::string &key_type, const std::string &value_type, std::optional<RootPointer> &root) const -> Status
{
    root.reset();
    const BTree directory {m_directory, PageHint::CLEAN, store(), &Codec<std::string>::compare};
    std::optional<ByteGuard> bytes;
    BIRCH_TRY_S(directory.get(name, bytes));
    if (!bytes)
        return Status::not_found("table \"" + name + "\" does not exist");

    TableRecord record;
    BIRCH_TRY_S(decode_record(bytes->bytes(), record));
    BIRCH_TRY_S(check_types(name, record, key_type, value_type));
    root = record.root;
    return Status::ok();
}

auto ReadTransaction::list_tables(std::vector<std::string> &out) const -> Status
{
    out.clear();
    std::set<std::string> names;
    const BTree directory {m_directory, PageHint::CLEAN, store(), &Codec<std::string>::compare};
    auto cursor = directory.range(ByteRange {});
    BIRCH_TRY_S(read_names(*cursor, names));
    out.assign(begin(names), end(names));
    return Status::ok();
}

} // namespace Birch
