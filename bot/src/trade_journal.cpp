#include "trade_journal.hpp"
#include <iostream>

TradeJournal::TradeJournal(const std::string& db_path) : db_path_(db_path) {
    int rc = sqlite3_open_v2(db_path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ Failed to open or create SQLite journal at " << db_path << ": "
                  << (db_ ? sqlite3_errmsg(db_) : "out of memory") << std::endl;
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return;
    }
    create_tables();
}

TradeJournal::~TradeJournal() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void TradeJournal::create_tables() {
    const char* create_table_sql = R"(
        CREATE TABLE IF NOT EXISTS trades (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            symbol TEXT NOT NULL,
            side TEXT NOT NULL,
            price REAL NOT NULL,
            quantity REAL NOT NULL,
            realized_pnl REAL DEFAULT 0,
            closing INTEGER DEFAULT 0,
            timestamp INTEGER NOT NULL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
        CREATE INDEX IF NOT EXISTS idx_trades_symbol ON trades(symbol);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, create_table_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ Failed to create trades table: " << (err_msg ? err_msg : "unknown") << std::endl;
        sqlite3_free(err_msg);
        sqlite3_close(db_);
        db_ = nullptr;
    } else {
        std::cout << "✅ Trade journal ready: " << db_path_ << std::endl;
    }
}

bool TradeJournal::append(const std::string& symbol, const TradeRecord& record) {
    if (!db_) {
        std::cerr << "⚠️ Journal not open, fill not journaled" << std::endl;
        return false;
    }

    const char* insert_sql = R"(
        INSERT INTO trades (symbol, side, price, quantity, realized_pnl, closing, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare insert statement: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }

    auto timestamp_ms = duration_cast<milliseconds>(record.timestamp.time_since_epoch()).count();
    std::string side = side_to_string(record.side);

    sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, side.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 3, record.price);
    sqlite3_bind_double(stmt, 4, record.quantity);
    sqlite3_bind_double(stmt, 5, record.realized_pnl);
    sqlite3_bind_int(stmt, 6, record.closing ? 1 : 0);
    sqlite3_bind_int64(stmt, 7, timestamp_ms);

    rc = sqlite3_step(stmt);
    bool ok = rc == SQLITE_DONE;
    if (!ok) {
        std::cerr << "❌ Failed to journal trade: " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::vector<TradeRecord> TradeJournal::load(const std::string& symbol) const {
    std::vector<TradeRecord> records;
    if (!db_) return records;

    const char* select_sql = R"(
        SELECT side, price, quantity, realized_pnl, closing, timestamp
        FROM trades
        WHERE symbol = ?
        ORDER BY id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare select statement: " << sqlite3_errmsg(db_) << std::endl;
        return records;
    }
    sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        TradeRecord r;
        const unsigned char* side = sqlite3_column_text(stmt, 0);
        r.side = (side && std::string(reinterpret_cast<const char*>(side)) == "SELL") ? OrderSide::SELL : OrderSide::BUY;
        r.price = sqlite3_column_double(stmt, 1);
        r.quantity = sqlite3_column_double(stmt, 2);
        r.realized_pnl = sqlite3_column_double(stmt, 3);
        r.closing = sqlite3_column_int(stmt, 4) != 0;
        r.timestamp = system_clock::time_point(milliseconds(sqlite3_column_int64(stmt, 5)));
        records.push_back(r);
    }
    if (rc != SQLITE_DONE) {
        std::cerr << "⚠️ Journal read stopped early: " << sqlite3_errmsg(db_) << std::endl;
    }

    sqlite3_finalize(stmt);
    return records;
}

int TradeJournal::count(const std::string& symbol) const {
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM trades WHERE symbol = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare count statement: " << sqlite3_errmsg(db_) << std::endl;
        return 0;
    }
    sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);

    int n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}
