// template_store.cpp - Durable per-identity palm registration store
// Copyright (c) 2025 Biometric Security Systems

#include "template_store.h"
#include "../utils/logger.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const std::string RECORD_EXTENSION = ".json";
const std::string TEMP_EXTENSION = ".tmp";
constexpr size_t MAX_IDENTITY_LENGTH = 128;

std::atomic<unsigned long> temp_counter{0};

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string errnoMessage(int error_number) {
    return std::string(std::strerror(error_number));
}

bool makeDirectories(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    std::string partial;
    std::istringstream segments(path);
    std::string segment;
    if (path[0] == '/') {
        partial = "/";
    }
    while (std::getline(segments, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        partial += segment;
        if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            Logger::error("Failed to create directory " + partial + ": " + errnoMessage(errno),
                          "store");
            return false;
        }
        partial += "/";
    }

    struct stat info;
    return ::stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}

bool writeAll(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

// Temp file in the same directory, fsync, rename over target, fsync directory
bool writeFileDurably(const std::string& directory, const std::string& target,
                      const std::string& content) {
    std::string temp_path = target + "." + std::to_string(::getpid()) + "." +
                            std::to_string(temp_counter.fetch_add(1)) + TEMP_EXTENSION;

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        Logger::error("Failed to create " + temp_path + ": " + errnoMessage(errno), "store");
        return false;
    }

    bool ok = writeAll(fd, content) && ::fsync(fd) == 0;
    int saved_errno = errno;
    if (::close(fd) != 0 && ok) {
        ok = false;
        saved_errno = errno;
    }

    if (ok && ::rename(temp_path.c_str(), target.c_str()) != 0) {
        ok = false;
        saved_errno = errno;
    }

    if (!ok) {
        Logger::error("Failed to write " + target + ": " + errnoMessage(saved_errno), "store");
        ::unlink(temp_path.c_str());
        return false;
    }

    int dir_fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        Logger::error("Failed to open " + directory + " for sync: " + errnoMessage(errno), "store");
        return false;
    }
    bool synced = ::fsync(dir_fd) == 0;
    saved_errno = errno;
    ::close(dir_fd);
    if (!synced) {
        Logger::error("Failed to sync " + directory + ": " + errnoMessage(saved_errno), "store");
        return false;
    }
    return true;
}

} // namespace

std::string storageErrorToString(StorageError error) {
    switch (error) {
        case StorageError::SUCCESS: return "SUCCESS";
        case StorageError::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case StorageError::NOT_FOUND: return "NOT_FOUND";
        case StorageError::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

std::string registerErrorToString(RegisterError error) {
    switch (error) {
        case RegisterError::SUCCESS: return "SUCCESS";
        case RegisterError::ALREADY_REGISTERED: return "ALREADY_REGISTERED";
        case RegisterError::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case RegisterError::STORAGE_IO_ERROR: return "STORAGE_IO_ERROR";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// TEMPLATE STORE IMPLEMENTATION
// ============================================================================

TemplateStore::TemplateStore(const std::string& data_directory)
    : data_directory_(data_directory)
{
    while (data_directory_.size() > 1 && data_directory_.back() == '/') {
        data_directory_.pop_back();
    }
}

bool TemplateStore::isValidIdentity(const std::string& identity) {
    if (identity.empty() || identity.size() > MAX_IDENTITY_LENGTH || identity[0] == '.') {
        return false;
    }
    for (char c : identity) {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                       (c >= '0' && c <= '9') ||
                       c == '.' || c == '_' || c == '+' || c == '@' || c == '-';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

std::string TemplateStore::recordPath(const std::string& identity) const {
    return data_directory_ + "/" + identity + RECORD_EXTENSION;
}

bool TemplateStore::open() {
    if (!makeDirectories(data_directory_)) {
        Logger::error("Data directory is not usable: " + data_directory_, "store");
        return false;
    }

    DIR* dir = ::opendir(data_directory_.c_str());
    if (!dir) {
        Logger::error("Failed to open data directory " + data_directory_ + ": " +
                      errnoMessage(errno), "store");
        return false;
    }

    int removed = 0;
    while (struct dirent* entry = ::readdir(dir)) {
        std::string name = entry->d_name;
        if (!endsWith(name, TEMP_EXTENSION) ||
            name.find(RECORD_EXTENSION + ".") == std::string::npos) {
            continue;
        }
        std::string path = data_directory_ + "/" + name;
        if (::unlink(path.c_str()) == 0) {
            ++removed;
        } else {
            Logger::warning("Failed to remove stale temporary file " + path + ": " +
                            errnoMessage(errno), "store");
        }
    }
    ::closedir(dir);

    if (removed > 0) {
        Logger::info("Removed " + std::to_string(removed) + " stale temporary files", "store");
    }
    Logger::debug("Template store opened at " + data_directory_, "store");
    return true;
}

std::shared_ptr<std::mutex> TemplateStore::identityLock(const std::string& identity) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = identity_locks_[identity];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

TemplateStore::ReadOutcome TemplateStore::readRegistration(const std::string& identity,
                                                           Registration& output,
                                                           std::string& detail) const {
    std::string path = recordPath(identity);

    struct stat info;
    if (::stat(path.c_str(), &info) != 0) {
        if (errno == ENOENT) {
            return ReadOutcome::ABSENT;
        }
        detail = errnoMessage(errno);
        return ReadOutcome::IO_ERROR;
    }
    if (!S_ISREG(info.st_mode)) {
        detail = "not a regular file";
        return ReadOutcome::IO_ERROR;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        // Lost a race with remove()
        if (errno == ENOENT) {
            return ReadOutcome::ABSENT;
        }
        detail = "cannot open file";
        return ReadOutcome::IO_ERROR;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        detail = "read failed";
        return ReadOutcome::IO_ERROR;
    }

    nlohmann::json document = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        detail = "invalid JSON";
        return ReadOutcome::CORRUPT;
    }

    Registration record;
    RecordError error = registrationFromJson(document, record, detail);
    if (error != RecordError::SUCCESS) {
        detail = recordErrorToString(error) + " (" + detail + ")";
        return ReadOutcome::CORRUPT;
    }

    if (record.identity != identity) {
        detail = "identity mismatch: " + record.identity;
        return ReadOutcome::CORRUPT;
    }

    output = std::move(record);
    return ReadOutcome::OK;
}

void TemplateStore::discardCorrupt(const std::string& identity) {
    auto identity_mutex = identityLock(identity);
    std::lock_guard<std::mutex> lock(*identity_mutex);
    discardCorruptLocked(identity);
}

void TemplateStore::discardCorruptLocked(const std::string& identity) {
    // A writer may have replaced the record since it was read
    Registration current;
    std::string detail;
    if (readRegistration(identity, current, detail) != ReadOutcome::CORRUPT) {
        return;
    }

    std::string path = recordPath(identity);
    if (::unlink(path.c_str()) == 0) {
        Logger::warning("Deleted corrupt record " + path + ": " + detail, "store");
    } else if (errno != ENOENT) {
        Logger::error("Failed to delete corrupt record " + path + ": " + errnoMessage(errno),
                      "store");
    }
}

std::optional<Registration> TemplateStore::load(const std::string& identity) {
    Registration record;
    if (loadChecked(identity, record) != StorageError::SUCCESS) {
        return std::nullopt;
    }
    return record;
}

StorageError TemplateStore::loadChecked(const std::string& identity, Registration& output) {
    if (!isValidIdentity(identity)) {
        Logger::warning("Rejected invalid identity on load", "store");
        return StorageError::INVALID_IDENTITY;
    }

    std::string detail;
    switch (readRegistration(identity, output, detail)) {
        case ReadOutcome::OK:
            return StorageError::SUCCESS;
        case ReadOutcome::CORRUPT:
            discardCorrupt(identity);
            return StorageError::NOT_FOUND;
        case ReadOutcome::IO_ERROR:
            Logger::error("Failed to read record for " + identity + ": " + detail, "store");
            return StorageError::IO_ERROR;
        case ReadOutcome::ABSENT:
        default:
            return StorageError::NOT_FOUND;
    }
}

StorageError TemplateStore::save(const std::string& identity, const Registration& record) {
    if (!isValidIdentity(identity) || record.identity != identity) {
        return StorageError::INVALID_IDENTITY;
    }

    auto identity_mutex = identityLock(identity);
    std::lock_guard<std::mutex> lock(*identity_mutex);
    return saveLocked(identity, record);
}

StorageError TemplateStore::saveLocked(const std::string& identity, const Registration& record) {
    std::string content = registrationToJson(record).dump(2) + "\n";
    if (!writeFileDurably(data_directory_, recordPath(identity), content)) {
        return StorageError::IO_ERROR;
    }
    return StorageError::SUCCESS;
}

bool TemplateStore::remove(const std::string& identity) {
    if (!isValidIdentity(identity)) {
        return false;
    }

    auto identity_mutex = identityLock(identity);
    std::lock_guard<std::mutex> lock(*identity_mutex);

    std::string path = recordPath(identity);
    if (::unlink(path.c_str()) != 0) {
        if (errno != ENOENT) {
            Logger::error("Failed to delete " + path + ": " + errnoMessage(errno), "store");
        }
        return false;
    }

    Logger::info("Deleted registration for " + identity, "store");
    return true;
}

std::vector<std::string> TemplateStore::listIdentities() const {
    std::vector<std::string> identities;

    DIR* dir = ::opendir(data_directory_.c_str());
    if (!dir) {
        if (errno != ENOENT) {
            Logger::error("Failed to list " + data_directory_ + ": " + errnoMessage(errno), "store");
        }
        return identities;
    }

    while (struct dirent* entry = ::readdir(dir)) {
        std::string name = entry->d_name;
        if (!endsWith(name, RECORD_EXTENSION)) {
            continue;
        }
        std::string identity = name.substr(0, name.size() - RECORD_EXTENSION.size());
        if (!isValidIdentity(identity)) {
            Logger::debug("Ignoring unexpected file " + name, "store");
            continue;
        }
        identities.push_back(identity);
    }
    ::closedir(dir);

    std::sort(identities.begin(), identities.end());
    return identities;
}

std::vector<Registration> TemplateStore::loadAll() {
    std::vector<Registration> records;
    for (const auto& identity : listIdentities()) {
        auto record = load(identity);
        if (record) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::vector<RegistrationSummary> TemplateStore::listAll() {
    std::vector<RegistrationSummary> summaries;
    for (const auto& record : loadAll()) {
        RegistrationSummary summary;
        summary.identity = record.identity;
        summary.registered_at = record.registered_at;
        summary.last_used = record.last_used;
        summaries.push_back(summary);
    }
    return summaries;
}

RegisterError TemplateStore::registerTemplate(const std::string& identity,
                                              const PalmTemplate& palm_template,
                                              Registration& output) {
    if (!isValidIdentity(identity)) {
        return RegisterError::INVALID_IDENTITY;
    }

    auto identity_mutex = identityLock(identity);
    std::lock_guard<std::mutex> lock(*identity_mutex);

    Registration existing;
    std::string detail;
    switch (readRegistration(identity, existing, detail)) {
        case ReadOutcome::OK:
            return RegisterError::ALREADY_REGISTERED;
        case ReadOutcome::IO_ERROR:
            Logger::error("Cannot check existing record for " + identity + ": " + detail, "store");
            return RegisterError::STORAGE_IO_ERROR;
        case ReadOutcome::CORRUPT:
            Logger::warning("Replacing corrupt record for " + identity + ": " + detail, "store");
            break;
        case ReadOutcome::ABSENT:
        default:
            break;
    }

    Registration record = makeRegistration(identity, palm_template, currentUtcTime());
    if (saveLocked(identity, record) != StorageError::SUCCESS) {
        return RegisterError::STORAGE_IO_ERROR;
    }

    Logger::info("Registered " + identity + " (signature " + record.signature + ")", "store");
    output = std::move(record);
    return RegisterError::SUCCESS;
}

StorageError TemplateStore::touch(const std::string& identity,
                                  const std::string& expected_signature,
                                  const Timestamp& when) {
    if (!isValidIdentity(identity)) {
        return StorageError::INVALID_IDENTITY;
    }

    auto identity_mutex = identityLock(identity);
    std::lock_guard<std::mutex> lock(*identity_mutex);

    Registration record;
    std::string detail;
    switch (readRegistration(identity, record, detail)) {
        case ReadOutcome::OK:
            break;
        case ReadOutcome::IO_ERROR:
            Logger::error("Failed to read record for " + identity + ": " + detail, "store");
            return StorageError::IO_ERROR;
        case ReadOutcome::CORRUPT:
            discardCorruptLocked(identity);
            return StorageError::NOT_FOUND;
        case ReadOutcome::ABSENT:
        default:
            return StorageError::NOT_FOUND;
    }

    if (record.signature != expected_signature) {
        Logger::debug("Record for " + identity + " changed since match, lastUsed not updated",
                      "store");
        return StorageError::NOT_FOUND;
    }

    record.last_used = std::chrono::time_point_cast<std::chrono::microseconds>(when);
    return saveLocked(identity, record);
}
