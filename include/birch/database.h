#ifndef BIRCH_DATABASE_H
#define BIRCH_DATABASE_H

#include <memory>
#include "options.h"
#include "table.h"

namespace Birch {

class DatabaseImpl;

/*
 * Embedded key-value database made of named, typed tables. There is at most one write transaction
 * at a time. Read transactions see the state as of the last commit before they began, and never
 * wait on the writer.
 */
class Database final {
public:
    [[nodiscard]] static auto open(const Options &options, std::unique_ptr<Database> &out) -> Status;

    ~Database();
    Database(const Database &) = delete;
    auto operator=(const Database &) -> Database & = delete;

    // Fails with a logic error while another write transaction is live.
    [[nodiscard]] auto begin_write(std::unique_ptr<WriteTransaction> &out) -> Status;
    [[nodiscard]] auto begin_read(std::unique_ptr<ReadTransaction> &out) -> Status;
    [[nodiscard]] auto page_size() const -> Size;

private:
    explicit Database(std::unique_ptr<DatabaseImpl> impl);

    std::unique_ptr<DatabaseImpl> m_impl;
};

} // namespace Birch

#endif // BIRCH_DATABASE_H
