#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace schema {
    inline constexpr const char* POKEMON = "pokemon";
    inline constexpr const char* TYPES = "types";
    inline constexpr const char* ABILITIES = "abilities";
    inline constexpr const char* TRAINERS = "trainers";
    inline constexpr const char* LINKS = "trainer_pokemon_abilities";
}

struct NamedRow {
    int64_t id;
    std::string name;
};

// One foreign-key column: table.column -> some referenced table's id.
struct ForeignKeyRef {
    std::string table;
    std::string column;
};

struct LinkRow {
    int64_t pokemon_id;
    int64_t trainer_id;
    int64_t ability_id;
};

// Raised when a canonical-name unique index rejects an insert.
class UniqueViolation : public std::runtime_error {
public:
    explicit UniqueViolation(const std::string& what) : std::runtime_error(what) {}
};

// A single storage transaction. Everything done through a session is rolled
// back when it is destroyed without commit().
class StoreSession {
public:
    virtual ~StoreSession() = default;
    
    // Rows of a named table (types, abilities, trainers, pokemon) ordered by id.
    virtual std::vector<NamedRow> list_named(const std::string& table) = 0;
    virtual void rename_row(const std::string& table, int64_t id, const std::string& name) = 0;
    virtual void delete_row(const std::string& table, int64_t id) = 0;
    
    virtual int64_t count_references(const ForeignKeyRef& ref, int64_t id) = 0;
    // Returns the number of rows rewritten.
    virtual int64_t remap_references(const ForeignKeyRef& ref, int64_t from_id, int64_t to_id) = 0;
    // Non-null values of ref that do not resolve to a row of target_table.
    virtual int64_t count_dangling(const ForeignKeyRef& ref, const std::string& target_table) = 0;
    
    virtual void enforce_unique_names(const std::string& table) = 0;
    
    virtual std::optional<NamedRow> find_by_key(const std::string& table, const std::string& key) = 0;
    // Returns the id of the row whose canonical name matches display_name,
    // inserting display_name if there is none.
    virtual int64_t find_or_insert(const std::string& table, const std::string& display_name) = 0;
    // Throws UniqueViolation if the name is already taken.
    virtual int64_t insert_pokemon(const std::string& name,
                                   std::optional<int64_t> type1_id,
                                   std::optional<int64_t> type2_id) = 0;
    virtual void insert_link(const LinkRow& link) = 0;
    
    virtual std::vector<std::string> pokemon_with_ability(int64_t ability_id) = 0;
    virtual std::vector<std::string> pokemon_with_type(int64_t type_id) = 0;
    virtual std::vector<std::string> trainers_of(int64_t pokemon_id) = 0;
    virtual std::vector<std::string> abilities_of(int64_t pokemon_id) = 0;
    
    virtual void commit() = 0;
};

class Store {
public:
    virtual ~Store() = default;
    
    virtual std::unique_ptr<StoreSession> begin() = 0;
};
