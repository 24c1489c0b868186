#pragma once
#include "errors.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

struct sqlite3;

namespace spychat {

struct Persona {
    std::string id;
    std::string name;
    std::string codename;
    std::string biography;
    std::string specialty;

    const std::string& display_name() const { return name; }

    nlohmann::json to_json() const {
        return {{"id", id}, {"name", name}, {"codename", codename},
                {"biography", biography}, {"specialty", specialty}};
    }

    static Persona from_json(const nlohmann::json& j) {
        Persona p;
        p.id = j.value("id", "");
        p.name = j.value("name", "");
        p.codename = j.value("codename", "");
        p.biography = j.value("biography", "");
        p.specialty = j.value("specialty", "");
        return p;
    }
};

// System prompt that keeps the agent in character and spells out when the
// mission lookup tool may be used.
std::string build_system_prompt(const Persona& persona);

// Read-only lookup consumed by the store and the chat session.
class PersonaDirectory {
public:
    virtual ~PersonaDirectory() = default;
    virtual Result<Persona> resolve(const std::string& id) const = 0;
};

class SqlitePersonaStore : public PersonaDirectory {
public:
    explicit SqlitePersonaStore(const std::string& db_path);
    ~SqlitePersonaStore() override;

    SqlitePersonaStore(const SqlitePersonaStore&) = delete;
    SqlitePersonaStore& operator=(const SqlitePersonaStore&) = delete;

    Result<Persona> resolve(const std::string& id) const override;

    // Assigns a fresh id when persona.id is empty. Fails when the codename
    // is already taken.
    Result<Persona> create(Persona persona);
    std::vector<Persona> list(int skip = 0, int limit = 100) const;
    Result<Persona> update(const std::string& id, const Persona& fields);
    bool remove(const std::string& id);
    std::optional<Persona> find_by_codename(const std::string& codename) const;

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    void init_db();
};

} // namespace spychat
