#pragma once

#include "store.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

class PostgresSession : public StoreSession {
public:
    explicit PostgresSession(const std::string& dsn);
    
    std::vector<NamedRow> list_named(const std::string& table) override;
    void rename_row(const std::string& table, int64_t id, const std::string& name) override;
    void delete_row(const std::string& table, int64_t id) override;
    
    int64_t count_references(const ForeignKeyRef& ref, int64_t id) override;
    int64_t remap_references(const ForeignKeyRef& ref, int64_t from_id, int64_t to_id) override;
    int64_t count_dangling(const ForeignKeyRef& ref, const std::string& target_table) override;
    
    void enforce_unique_names(const std::string& table) override;
    
    std::optional<NamedRow> find_by_key(const std::string& table, const std::string& key) override;
    int64_t find_or_insert(const std::string& table, const std::string& display_name) override;
    int64_t insert_pokemon(const std::string& name,
                           std::optional<int64_t> type1_id,
                           std::optional<int64_t> type2_id) override;
    void insert_link(const LinkRow& link) override;
    
    std::vector<std::string> pokemon_with_ability(int64_t ability_id) override;
    std::vector<std::string> pokemon_with_type(int64_t type_id) override;
    std::vector<std::string> trainers_of(int64_t pokemon_id) override;
    std::vector<std::string> abilities_of(int64_t pokemon_id) override;
    
    void commit() override;
    
private:
    pqxx::connection conn_;
    pqxx::work txn_;
    
    std::vector<std::string> names(const pqxx::result& result) const;
};

class PostgresStore : public Store {
public:
    explicit PostgresStore(const std::string& dsn);
    
    void init_schema();
    std::unique_ptr<StoreSession> begin() override;
    bool ping();
    
private:
    std::string dsn_;
};
