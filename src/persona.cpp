#include "persona.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <iostream>

namespace spychat {

std::string build_system_prompt(const Persona& persona) {
    std::string name = persona.name.empty() ? "a top secret agent" : persona.name;
    std::string codename = persona.codename.empty() ? "CLASSIFIED" : persona.codename;
    std::string biography = persona.biography.empty() ? "No additional information available" : persona.biography;
    std::string specialty = persona.specialty.empty() ? "covert operations" : persona.specialty;

    return "You are " + name + ", a spy with the following profile:\n\n"
           "Codename: " + codename + "\n"
           "Biography: " + biography + "\n"
           "Specialty: " + specialty + "\n\n"
           "You can look up mission records with the get_mission_context tool. Rules:\n"
           "1. Call it only when the user names a specific mission ID.\n"
           "2. General questions are answered without tools.\n"
           "3. If the user wants mission details but gave no ID, ask which mission they mean.\n"
           "4. Use mission IDs exactly as given; never guess one.\n"
           "5. If a lookup fails, say so in character.\n\n"
           "Stay in character as " + name + " at all times. Keep answers short. "
           "You may invent details as long as they fit the known context.";
}

// ── SQLite-backed persona table ────────────────────────────────────────

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

static sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    return stmt;
}

static Persona read_row(sqlite3_stmt* stmt) {
    Persona p;
    p.id = column_text(stmt, 0);
    p.name = column_text(stmt, 1);
    p.codename = column_text(stmt, 2);
    p.biography = column_text(stmt, 3);
    p.specialty = column_text(stmt, 4);
    return p;
}

SqlitePersonaStore::SqlitePersonaStore(const std::string& db_path) {
    if (db_path != ":memory:") {
        auto parent = fs::path(db_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    }
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        throw std::runtime_error("Failed to open persona DB: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    init_db();
}

SqlitePersonaStore::~SqlitePersonaStore() {
    if (db_) sqlite3_close(db_);
}

void SqlitePersonaStore::init_db() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS spies (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            codename TEXT NOT NULL UNIQUE,
            biography TEXT NOT NULL,
            specialty TEXT NOT NULL
        );
    )";
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to init persona DB: " + msg);
    }
}

Result<Persona> SqlitePersonaStore::resolve(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_, "SELECT id, name, codename, biography, specialty FROM spies WHERE id = ?");
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    Result<Persona> result = not_found("Spy " + id + " not found");
    if (sqlite3_step(stmt) == SQLITE_ROW) result = read_row(stmt);
    sqlite3_finalize(stmt);
    return result;
}

std::optional<Persona> SqlitePersonaStore::find_by_codename(const std::string& codename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_, "SELECT id, name, codename, biography, specialty FROM spies WHERE codename = ?");
    sqlite3_bind_text(stmt, 1, codename.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<Persona> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) result = read_row(stmt);
    sqlite3_finalize(stmt);
    return result;
}

Result<Persona> SqlitePersonaStore::create(Persona persona) {
    if (persona.id.empty()) persona.id = generate_uuid();
    if (persona.name.empty() || persona.codename.empty()) {
        return Error{ErrorKind::invalid_request, "name and codename are required"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_,
        "INSERT INTO spies (id, name, codename, biography, specialty) VALUES (?, ?, ?, ?, ?)");
    sqlite3_bind_text(stmt, 1, persona.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, persona.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, persona.codename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, persona.biography.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, persona.specialty.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return Error{ErrorKind::invalid_request, "codename or id already in use: " + persona.codename};
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to insert spy: " + std::string(sqlite3_errmsg(db_)));
    }
    return persona;
}

std::vector<Persona> SqlitePersonaStore::list(int skip, int limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Persona> out;
    sqlite3_stmt* stmt = prepare(db_,
        "SELECT id, name, codename, biography, specialty FROM spies ORDER BY codename LIMIT ? OFFSET ?");
    sqlite3_bind_int(stmt, 1, limit);
    sqlite3_bind_int(stmt, 2, skip);
    while (sqlite3_step(stmt) == SQLITE_ROW) out.push_back(read_row(stmt));
    sqlite3_finalize(stmt);
    return out;
}

Result<Persona> SqlitePersonaStore::update(const std::string& id, const Persona& fields) {
    auto current = resolve(id);
    if (is_error(current)) return current;

    Persona p = get_value(current);
    if (!fields.name.empty()) p.name = fields.name;
    if (!fields.codename.empty()) p.codename = fields.codename;
    if (!fields.biography.empty()) p.biography = fields.biography;
    if (!fields.specialty.empty()) p.specialty = fields.specialty;

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_,
        "UPDATE spies SET name = ?, codename = ?, biography = ?, specialty = ? WHERE id = ?");
    sqlite3_bind_text(stmt, 1, p.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, p.codename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, p.biography.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, p.specialty.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_CONSTRAINT) {
        return Error{ErrorKind::invalid_request, "codename already in use: " + p.codename};
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to update spy: " + std::string(sqlite3_errmsg(db_)));
    }
    return p;
}

bool SqlitePersonaStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = prepare(db_, "DELETE FROM spies WHERE id = ?");
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    int changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "[personas] Delete failed: " << sqlite3_errmsg(db_) << "\n";
        return false;
    }
    return changes > 0;
}

} // namespace spychat
