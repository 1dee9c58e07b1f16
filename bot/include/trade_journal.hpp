#pragma once

#include <string>
#include <vector>
#include <sqlite3.h>
#include "portfolio_ledger.hpp"

/*
 * TRADE JOURNAL
 *
 * Append-only SQLite copy of every fill the ledger books, so the trade
 * history and an open position survive a restart. Journal failures are
 * logged and never stop trading.
 */
class TradeJournal {
public:
    explicit TradeJournal(const std::string& db_path);
    ~TradeJournal();

    TradeJournal(const TradeJournal&) = delete;
    TradeJournal& operator=(const TradeJournal&) = delete;

    bool is_open() const { return db_ != nullptr; }

    bool append(const std::string& symbol, const TradeRecord& record);

    // Fills for the symbol in booking order
    std::vector<TradeRecord> load(const std::string& symbol) const;

    int count(const std::string& symbol) const;

private:
    void create_tables();

    sqlite3* db_ = nullptr;
    std::string db_path_;
};
