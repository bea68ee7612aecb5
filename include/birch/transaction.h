#ifndef BIRCH_TRANSACTION_H
#define BIRCH_TRANSACTION_H

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "btree.h"

namespace Birch {

class DatabaseImpl;

template<class K, class V>
class Table;

template<class K, class V>
class ReadOnlyTable;

/*
 * Name and key/value types of a table.
 */
template<class K, class V>
class TableDefinition final {
public:
    explicit TableDefinition(std::string name)
        : m_name {std::move(name)}
    {}

    [[nodiscard]]
    auto name() const -> const std::string &
    {
        return m_name;
    }

private:
    std::string m_name;
};

// What the table directory records about each table.
struct TableRecord {
    std::optional<RootPointer> root;
    std::string key_type;
    std::string value_type;
};

/*
 * The single write transaction of a database. Tables opened through it must be destroyed before
 * the transaction is committed, and before the transaction itself is destroyed. A transaction
 * that is destroyed without being committed is aborted.
 */
class WriteTransaction final {
public:
    ~WriteTransaction();
    WriteTransaction(const WriteTransaction &) = delete;
    auto operator=(const WriteTransaction &) -> WriteTransaction & = delete;

    /*
     * Open a table, creating it if it does not exist. Only one handle to a given table may be open
     * at a time.
     */
    template<class K, class V>
    [[nodiscard]] auto open_table(const TableDefinition<K, V> &definition, std::unique_ptr<Table<K, V>> &out) -> Status;

    [[nodiscard]] auto delete_table(const std::string &name, bool &existed) -> Status;
    [[nodiscard]] auto list_tables(std::vector<std::string> &out) const -> Status;
    [[nodiscard]] auto commit() -> Status;
    [[nodiscard]] auto abort() -> Status;

private:
    friend class DatabaseImpl;

    template<class, class>
    friend class Table;

    WriteTransaction(DatabaseImpl &impl, std::optional<RootPointer> directory);
    [[nodiscard]] auto open_tree(const std::string &name, const std::string &key_type, const std::string &value_type, Comparator cmp, std::unique_ptr<BTreeMut> &out) -> Status;
    [[nodiscard]] auto lookup(const std::string &name, std::optional<TableRecord> &out) const -> Status;
    auto close_table(const std::string &name, BTreeMut &tree) -> void;
    auto rollback() -> void;

    std::vector<PageNumber> m_freed;

    // Tables created, changed, or deleted (null) by this transaction.
    std::map<std::string, std::optional<TableRecord>> m_pending;

    // Names of the tables with a live handle.
    std::set<std::string> m_open;

    std::unique_ptr<BTreeMut> m_directory;
    Status m_status {Status::ok()};
    DatabaseImpl *m_impl {};
    bool m_is_finished {};
};

/*
 * Snapshot of the database as of the last commit before it began.
 */
class ReadTransaction final {
public:
    ~ReadTransaction();
    ReadTransaction(const ReadTransaction &) = delete;
    auto operator=(const ReadTransaction &) -> ReadTransaction & = delete;

    template<class K, class V>
    [[nodiscard]] auto open_table(const TableDefinition<K, V> &definition, std::unique_ptr<ReadOnlyTable<K, V>> &out) const -> Status;

    [[nodiscard]] auto list_tables(std::vector<std::string> &out) const -> Status;

    [[nodiscard]]
    auto version() const -> Size
    {
        return m_version;
    }

private:
    friend class DatabaseImpl;

    ReadTransaction(DatabaseImpl &impl, std::optional<RootPointer> directory, Size version);
    [[nodiscard]] auto open_tree(const std::string &name, const std::string &key_type, const std::string &value_type, std::optional<RootPointer> &root) const -> Status;
    [[nodiscard]] auto store() const -> PageStore &;

    std::optional<RootPointer> m_directory;
    Size m_version {};
    DatabaseImpl *m_impl {};
};

} // namespace Birch

#endif // BIRCH_TRANSACTION_H
