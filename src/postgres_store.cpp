#include "postgres_store.hpp"
#include "normalizer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

// Same folding as Normalizer::canonical_form: trims ASCII whitespace and
// lowercases A-Z only, whatever the database collation does with other bytes.
const std::string CANONICAL_NAME =
    "TRANSLATE(BTRIM(name, E' \\t\\n\\r\\f\\x0B'), "
    "'ABCDEFGHIJKLMNOPQRSTUVWXYZ', 'abcdefghijklmnopqrstuvwxyz')";

} // namespace

PostgresSession::PostgresSession(const std::string& dsn)
    : conn_(dsn)
    , txn_(conn_)
{}

std::vector<std::string> PostgresSession::names(const pqxx::result& result) const {
    std::vector<std::string> out;
    out.reserve(result.size());
    for (const auto& row : result) {
        out.push_back(row[0].as<std::string>());
    }
    return out;
}

std::vector<NamedRow> PostgresSession::list_named(const std::string& table) {
    auto result = txn_.exec(
        "SELECT id, COALESCE(name, '') FROM " + txn_.quote_name(table) + " ORDER BY id"
    );
    
    std::vector<NamedRow> rows;
    rows.reserve(result.size());
    for (const auto& row : result) {
        rows.push_back(NamedRow{row[0].as<int64_t>(), row[1].as<std::string>()});
    }
    return rows;
}

void PostgresSession::rename_row(const std::string& table, int64_t id, const std::string& name) {
    txn_.exec_params(
        "UPDATE " + txn_.quote_name(table) + " SET name = $1 WHERE id = $2",
        name, id
    );
}

void PostgresSession::delete_row(const std::string& table, int64_t id) {
    txn_.exec_params(
        "DELETE FROM " + txn_.quote_name(table) + " WHERE id = $1",
        id
    );
}

int64_t PostgresSession::count_references(const ForeignKeyRef& ref, int64_t id) {
    auto result = txn_.exec_params(
        "SELECT COUNT(*) FROM " + txn_.quote_name(ref.table) +
        " WHERE " + txn_.quote_name(ref.column) + " = $1",
        id
    );
    return result[0][0].as<int64_t>();
}

int64_t PostgresSession::remap_references(const ForeignKeyRef& ref, int64_t from_id, int64_t to_id) {
    auto result = txn_.exec_params(
        "UPDATE " + txn_.quote_name(ref.table) +
        " SET " + txn_.quote_name(ref.column) + " = $1" +
        " WHERE " + txn_.quote_name(ref.column) + " = $2",
        to_id, from_id
    );
    return static_cast<int64_t>(result.affected_rows());
}

int64_t PostgresSession::count_dangling(const ForeignKeyRef& ref, const std::string& target_table) {
    auto column = "r." + txn_.quote_name(ref.column);
    auto result = txn_.exec(
        "SELECT COUNT(*) FROM " + txn_.quote_name(ref.table) + " r"
        " LEFT JOIN " + txn_.quote_name(target_table) + " t ON t.id = " + column +
        " WHERE " + column + " IS NOT NULL AND t.id IS NULL"
    );
    return result[0][0].as<int64_t>();
}

void PostgresSession::enforce_unique_names(const std::string& table) {
    // Replaces the index of older deployments, which folded with LOWER(TRIM(name)).
    txn_.exec("DROP INDEX IF EXISTS " + txn_.quote_name(table + "_canonical_name_idx"));
    txn_.exec(
        "CREATE UNIQUE INDEX IF NOT EXISTS " + txn_.quote_name(table + "_name_key_idx") +
        " ON " + txn_.quote_name(table) + " ((" + CANONICAL_NAME + "))"
    );
}

std::optional<NamedRow> PostgresSession::find_by_key(const std::string& table, const std::string& key) {
    auto result = txn_.exec_params(
        "SELECT id, name FROM " + txn_.quote_name(table) +
        " WHERE " + CANONICAL_NAME + " = $1 ORDER BY id LIMIT 1",
        key
    );
    
    if (result.empty()) {
        return std::nullopt;
    }
    return NamedRow{result[0][0].as<int64_t>(), result[0][1].as<std::string>()};
}

int64_t PostgresSession::find_or_insert(const std::string& table, const std::string& display_name) {
    // Waits on a concurrent uncommitted insert of the same name, then yields to it.
    auto inserted = txn_.exec_params(
        "INSERT INTO " + txn_.quote_name(table) + " (name) VALUES ($1) "
        "ON CONFLICT ((" + CANONICAL_NAME + ")) DO NOTHING "
        "RETURNING id",
        display_name
    );
    if (!inserted.empty()) {
        return inserted[0][0].as<int64_t>();
    }
    
    auto existing = find_by_key(table, Normalizer::canonical_form(display_name));
    if (!existing) {
        throw std::runtime_error("Row '" + display_name + "' vanished from " + table);
    }
    return existing->id;
}

int64_t PostgresSession::insert_pokemon(const std::string& name,
                                        std::optional<int64_t> type1_id,
                                        std::optional<int64_t> type2_id) {
    try {
        auto result = txn_.exec_params(
            "INSERT INTO pokemon (name, type1_id, type2_id) VALUES ($1, $2, $3) RETURNING id",
            name, type1_id, type2_id
        );
        return result[0][0].as<int64_t>();
        
    } catch (const pqxx::unique_violation& e) {
        throw UniqueViolation(e.what());
    }
}

void PostgresSession::insert_link(const LinkRow& link) {
    txn_.exec_params(
        "INSERT INTO trainer_pokemon_abilities (pokemon_id, trainer_id, ability_id) "
        "VALUES ($1, $2, $3)",
        link.pokemon_id, link.trainer_id, link.ability_id
    );
}

std::vector<std::string> PostgresSession::pokemon_with_ability(int64_t ability_id) {
    return names(txn_.exec_params(
        "SELECT DISTINCT p.name FROM trainer_pokemon_abilities l "
        "JOIN pokemon p ON p.id = l.pokemon_id "
        "WHERE l.ability_id = $1 ORDER BY p.name",
        ability_id
    ));
}

std::vector<std::string> PostgresSession::pokemon_with_type(int64_t type_id) {
    return names(txn_.exec_params(
        "SELECT DISTINCT name FROM pokemon "
        "WHERE type1_id = $1 OR type2_id = $1 ORDER BY name",
        type_id
    ));
}

std::vector<std::string> PostgresSession::trainers_of(int64_t pokemon_id) {
    return names(txn_.exec_params(
        "SELECT DISTINCT t.name FROM trainer_pokemon_abilities l "
        "JOIN trainers t ON t.id = l.trainer_id "
        "WHERE l.pokemon_id = $1 ORDER BY t.name",
        pokemon_id
    ));
}

std::vector<std::string> PostgresSession::abilities_of(int64_t pokemon_id) {
    return names(txn_.exec_params(
        "SELECT DISTINCT a.name FROM trainer_pokemon_abilities l "
        "JOIN abilities a ON a.id = l.ability_id "
        "WHERE l.pokemon_id = $1 ORDER BY a.name",
        pokemon_id
    ));
}

void PostgresSession::commit() {
    txn_.commit();
}

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

std::unique_ptr<StoreSession> PostgresStore::begin() {
    return std::make_unique<PostgresSession>(dsn_);
}

void PostgresStore::init_schema() {
    try {
        pqxx::connection conn(dsn_);
        pqxx::work txn(conn);
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS types (
                id BIGSERIAL PRIMARY KEY,
                name TEXT NOT NULL
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS abilities (
                id BIGSERIAL PRIMARY KEY,
                name TEXT NOT NULL
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trainers (
                id BIGSERIAL PRIMARY KEY,
                name TEXT NOT NULL
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS pokemon (
                id BIGSERIAL PRIMARY KEY,
                name TEXT NOT NULL,
                type1_id BIGINT REFERENCES types(id),
                type2_id BIGINT REFERENCES types(id)
            )
        )");
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS trainer_pokemon_abilities (
                id BIGSERIAL PRIMARY KEY,
                pokemon_id BIGINT NOT NULL REFERENCES pokemon(id),
                trainer_id BIGINT NOT NULL REFERENCES trainers(id),
                ability_id BIGINT NOT NULL REFERENCES abilities(id)
            )
        )");
        
        txn.commit();
        spdlog::info("Database schema initialized");
        
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

bool PostgresStore::ping() {
    try {
        pqxx::connection conn(dsn_);
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
