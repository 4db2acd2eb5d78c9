// template_store.h - Durable per-identity palm registration store
// Copyright (c) 2025 Biometric Security Systems

#ifndef TEMPLATE_STORE_H
#define TEMPLATE_STORE_H

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "registration.h"

enum class StorageError {
    SUCCESS,
    INVALID_IDENTITY,
    NOT_FOUND,
    IO_ERROR
};

enum class RegisterError {
    SUCCESS,
    ALREADY_REGISTERED,
    INVALID_IDENTITY,
    STORAGE_IO_ERROR
};

std::string storageErrorToString(StorageError error);
std::string registerErrorToString(RegisterError error);

/**
 * One JSON file per identity under a data directory: <dir>/<identity>.json.
 *
 * Writers (save, remove, registerTemplate, touch) serialize on a per-identity
 * mutex. Readers take no lock; records are replaced by rename so a reader
 * sees either the old or the new file. A record that fails to parse or
 * validate is deleted and reported as absent.
 */
class TemplateStore {
public:
    explicit TemplateStore(const std::string& data_directory);
    ~TemplateStore() = default;

    TemplateStore(const TemplateStore&) = delete;
    TemplateStore& operator=(const TemplateStore&) = delete;

    // Creates the data directory and removes temporary files left by
    // interrupted writes
    bool open();

    const std::string& dataDirectory() const { return data_directory_; }
    std::string recordPath(const std::string& identity) const;

    std::optional<Registration> load(const std::string& identity);

    // Like load() but keeps a missing record (NOT_FOUND) apart from one that
    // could not be read (IO_ERROR). Corrupt records are discarded as in load().
    StorageError loadChecked(const std::string& identity, Registration& output);
    StorageError save(const std::string& identity, const Registration& record);

    // True if a record existed and was removed
    bool remove(const std::string& identity);

    // Valid records only, sorted by identity
    std::vector<RegistrationSummary> listAll();
    std::vector<Registration> loadAll();

    // Fails with ALREADY_REGISTERED if a valid record exists for identity
    RegisterError registerTemplate(const std::string& identity,
                                   const PalmTemplate& palm_template,
                                   Registration& output);

    // Sets lastUsed only if the live record still carries expected_signature
    StorageError touch(const std::string& identity,
                       const std::string& expected_signature,
                       const Timestamp& when);

    // 1-128 chars of [A-Za-z0-9._+@-], not starting with '.'
    static bool isValidIdentity(const std::string& identity);

private:
    enum class ReadOutcome {
        OK,
        ABSENT,
        CORRUPT,
        IO_ERROR
    };

    ReadOutcome readRegistration(const std::string& identity, Registration& output,
                                 std::string& detail) const;
    StorageError saveLocked(const std::string& identity, const Registration& record);
    void discardCorrupt(const std::string& identity);
    void discardCorruptLocked(const std::string& identity);
    std::vector<std::string> listIdentities() const;
    std::shared_ptr<std::mutex> identityLock(const std::string& identity);

    std::string data_directory_;

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> identity_locks_;
    std::mutex locks_mutex_;
};

#endif // TEMPLATE_STORE_H
