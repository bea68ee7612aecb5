#ifndef BIRCH_TABLE_H
#define BIRCH_TABLE_H

#include <utility>
#include "transaction.h"

namespace Birch {

/*
 * Typed sequence of entries produced by a range scan or a drain. Either end may be consumed.
 */
template<class K, class V>
class EntryIter final {
public:
    using Entry = std::pair<AccessGuard<K>, AccessGuard<V>>;

    explicit EntryIter(std::unique_ptr<EntryCursor> cursor)
        : m_cursor {std::move(cursor)}
    {}

    [[nodiscard]]
    auto next() -> std::optional<Entry>
    {
        return wrap(m_cursor->next());
    }

    [[nodiscard]]
    auto next_back() -> std::optional<Entry>
    {
        return wrap(m_cursor->next_back());
    }

    [[nodiscard]]
    auto status() const -> Status
    {
        return m_cursor->status();
    }

private:
    static auto wrap(std::optional<EntryGuards> entry) -> std::optional<Entry>
    {
        if (!entry)
            return std::nullopt;
        return Entry {AccessGuard<K> {std::move(entry->key)}, AccessGuard<V> {std::move(entry->value)}};
    }

    std::unique_ptr<EntryCursor> m_cursor;
};

template<class K, class V>
using RangeIter = EntryIter<K, V>;

template<class K, class V>
using Drain = EntryIter<K, V>;

/*
 * Read operations shared by Table and ReadOnlyTable.
 */
template<class K, class V>
class ReadableTable {
public:
    virtual ~ReadableTable() = default;
    [[nodiscard]] virtual auto get(const K &key, std::optional<AccessGuard<V>> &out) const -> Status = 0;
    [[nodiscard]] virtual auto range(const KeyRange<K> &range) const -> RangeIter<K, V> = 0;
    [[nodiscard]] virtual auto len(Size &out) const -> Status = 0;

    [[nodiscard]]
    auto is_empty(bool &out) const -> Status
    {
        Size n {};
        auto s = len(n);
        out = n == 0;
        return s;
    }

    [[nodiscard]]
    auto iter() const -> RangeIter<K, V>
    {
        return range(KeyRange<K>::all());
    }
};

namespace Impl {

    template<class V>
    auto wrap_guard(std::optional<ByteGuard> &bytes, std::optional<AccessGuard<V>> &out) -> void
    {
        out.reset();
        if (bytes)
            out.emplace(std::move(*bytes));
    }

} // namespace Impl

/*
 * Table opened in a write transaction. The table's changes are handed back to the transaction
 * when the table is destroyed. Guards returned by a table must not outlive it.
 */
template<class K, class V>
class Table final: public ReadableTable<K, V> {
public:
    using Entry = std::pair<AccessGuard<K>, AccessGuard<V>>;

    ~Table() override
    {
        m_txn->close_table(m_name, *m_tree);
    }

    Table(const Table &) = delete;
    auto operator=(const Table &) -> Table & = delete;

    [[nodiscard]]
    auto name() const -> const std::string &
    {
        return m_name;
    }

    [[nodiscard]]
    auto insert(const K &key, const V &value) -> Status
    {
        std::optional<AccessGuard<V>> old;
        return insert(key, value, old);
    }

    // Insert or overwrite an entry. "old" receives the value that was replaced, if any.
    [[nodiscard]]
    auto insert(const K &key, const V &value, std::optional<AccessGuard<V>> &old) -> Status
    {
        std::optional<ByteGuard> bytes;
        auto s = m_tree->insert(Codec<K>::encode(key), Codec<V>::encode(value), bytes);
        Impl::wrap_guard(bytes, old);
        return s;
    }

    // Insert an entry whose value is written through "out" afterward.
    [[nodiscard]]
    auto insert_reserve(const K &key, Size length, AccessGuardMut &out) -> Status
    {
        return m_tree->insert_reserve(Codec<K>::encode(key), length, out);
    }

    [[nodiscard]]
    auto remove(const K &key, std::optional<AccessGuard<V>> &out) -> Status
    {
        std::optional<ByteGuard> bytes;
        auto s = m_tree->remove(Codec<K>::encode(key), bytes);
        Impl::wrap_guard(bytes, out);
        return s;
    }

    [[nodiscard]]
    auto pop_first(std::optional<Entry> &out) -> Status
    {
        std::optional<EntryGuards> entry;
        auto s = m_tree->pop_first(entry);
        wrap_entry(entry, out);
        return s;
    }

    [[nodiscard]]
    auto pop_last(std::optional<Entry> &out) -> Status
    {
        std::optional<EntryGuards> entry;
        auto s = m_tree->pop_last(entry);
        wrap_entry(entry, out);
        return s;
    }

    // Entries are removed as they are produced. Entries that are never produced stay in the table.
    [[nodiscard]]
    auto drain(const KeyRange<K> &range) -> Drain<K, V>
    {
        return Drain<K, V> {m_tree->drain(range.bytes())};
    }

    [[nodiscard]]
    auto get(const K &key, std::optional<AccessGuard<V>> &out) const -> Status override
    {
        std::optional<ByteGuard> bytes;
        auto s = m_tree->get(Codec<K>::encode(key), bytes);
        Impl::wrap_guard(bytes, out);
        return s;
    }

    [[nodiscard]]
    auto range(const KeyRange<K> &range) const -> RangeIter<K, V> override
    {
        return RangeIter<K, V> {m_tree->range(range.bytes())};
    }

    [[nodiscard]]
    auto len(Size &out) const -> Status override
    {
        return m_tree->len(out);
    }

    [[nodiscard]]
    auto print_debug(bool include_values, std::string &out) const -> Status
    {
        return m_tree->print_debug(include_values, out);
    }

private:
    friend class WriteTransaction;

    Table(std::string name, WriteTransaction &txn, std::unique_ptr<BTreeMut> tree)
        : m_name {std::move(name)},
          m_tree {std::move(tree)},
          m_txn {&txn}
    {}

    static auto wrap_entry(std::optional<EntryGuards> &entry, std::optional<Entry> &out) -> void
    {
        out.reset();
        if (entry)
            out.emplace(AccessGuard<K> {std::move(entry->key)}, AccessGuard<V> {std::move(entry->value)});
    }

    std::string m_name;
    std::unique_ptr<BTreeMut> m_tree;
    WriteTransaction *m_txn {};
};

/*
 * Table opened in a read transaction, or directly over a root pointer.
 */
template<class K, class V>
class ReadOnlyTable final: public ReadableTable<K, V> {
public:
    ReadOnlyTable(std::optional<RootPointer> root, PageHint hint, PageStore &store)
        : m_tree {root, hint, store, &Codec<K>::compare}
    {}

    ~ReadOnlyTable() override = default;

    [[nodiscard]]
    auto get(const K &key, std::optional<AccessGuard<V>> &out) const -> Status override
    {
        std::optional<ByteGuard> bytes;
        auto s = m_tree.get(Codec<K>::encode(key), bytes);
        Impl::wrap_guard(bytes, out);
        return s;
    }

    [[nodiscard]]
    auto range(const KeyRange<K> &range) const -> RangeIter<K, V> override
    {
        return RangeIter<K, V> {m_tree.range(range.bytes())};
    }

    [[nodiscard]]
    auto len(Size &out) const -> Status override
    {
        return m_tree.len(out);
    }

    [[nodiscard]]
    auto print_debug(bool include_values, std::string &out) const -> Status
    {
        return m_tree.print_debug(include_values, out);
    }

private:
    BTree m_tree;
};

template<class K, class V>
auto WriteTransaction::open_table(const TableDefinition<K, V> &definition, std::unique_ptr<Table<K, V>> &out) -> Status
{
    std::unique_ptr<BTreeMut> tree;
    auto s = open_tree(definition.name(), Codec<K>::type_name(), Codec<V>::type_name(), &Codec<K>::compare, tree);
    if (s.is_ok())
        out.reset(new Table<K, V> {definition.name(), *this, std::move(tree)});
    return s;
}

template<class K, class V>
auto ReadTransaction::open_table(const TableDefinition<K, V> &definition, std::unique_ptr<ReadOnlyTable<K, V>> &out) const -> Status
{
    std::optional<RootPointer> root;
    auto s = open_tree(definition.name(), Codec<K>::type_name(), Codec<V>::type_name(), root);
    if (s.is_ok())
        out = std::make_unique<ReadOnlyTable<K, V>>(root, PageHint::CLEAN, store());
    return s;
}

} // namespace Birch

#endif // BIRCH_TABLE_H
