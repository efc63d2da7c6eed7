#include "relay/auth/credential_store.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "relay/common/encoding.hpp"

namespace relay::auth
{
    CredentialStore::CredentialStore(std::string db_path, const int iterations)
        : db_path_(std::move(db_path)),
          iterations_(iterations)
    {
        if (iterations_ < 1)
            throw std::invalid_argument("PBKDF2 iteration count must be positive");

        if (!db_path_.empty())
            load_users(db_path_);
    }

    std::vector<uint8_t> CredentialStore::derive_hash(const std::string& password,
                                                      const std::vector<uint8_t>& salt,
                                                      const int iterations)
    {
        std::vector<uint8_t> hash(kHashSize);
        if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                              salt.data(), static_cast<int>(salt.size()),
                              iterations, EVP_sha256(),
                              static_cast<int>(hash.size()), hash.data()) != 1)
            throw std::runtime_error("Failed to derive password hash");
        return hash;
    }

    bool CredentialStore::register_user(const std::string& username, const std::string& password)
    {
        if (username.empty() || password.empty())
            return false;

        // ':' separates fields in the database file
        if (username.find(':') != std::string::npos || username.find('\n') != std::string::npos)
            return false;

        UserCredentials creds{
            .username = username,
            .salt = encoding::random_bytes(kSaltSize),
            .hash = {},
            .iterations = iterations_
        };
        creds.hash = derive_hash(password, creds.salt, creds.iterations);

        {
            std::lock_guard<std::mutex> lock(users_mutex_);
            if (users_.contains(username))
                return false;
            users_.emplace(username, std::move(creds));
        }

        // save the database immediately; the in-memory entry stays valid on failure
        if (!db_path_.empty()) {
            try {
                save_users(db_path_);
            }
            catch (const std::exception& e) {
                std::cerr << "Failed to persist user database: " << e.what() << std::endl;
            }
        }

        return true;
    }

    bool CredentialStore::verify(const std::string& username, const std::string& password)
    {
        UserCredentials creds;
        {
            std::lock_guard<std::mutex> lock(users_mutex_);
            const auto it = users_.find(username);
            if (it == users_.end())
                return false;
            creds = it->second;
        }

        const auto candidate = derive_hash(password, creds.salt, creds.iterations);
        if (candidate.size() != creds.hash.size())
            return false;

        // constant-time comparison
        return CRYPTO_memcmp(candidate.data(), creds.hash.data(), candidate.size()) == 0;
    }

    size_t CredentialStore::user_count() const
    {
        std::lock_guard<std::mutex> lock(users_mutex_);
        return users_.size();
    }

    void CredentialStore::load_users(const std::string& filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
            return; // file doesn't exist yet

        std::unordered_map<std::string, UserCredentials> loaded;

        std::string line;
        size_t line_number = 0;
        while (std::getline(file, line))
        {
            ++line_number;
            if (line.empty() || line[0] == '#')
                continue;

            std::istringstream iss(line);
            std::string username, salt_hex, hash_hex, iterations_str;

            if (!std::getline(iss, username, ':') ||
                !std::getline(iss, salt_hex, ':') ||
                !std::getline(iss, hash_hex, ':') ||
                !std::getline(iss, iterations_str))
            {
                std::cerr << "Skipping malformed user record at line " << line_number << std::endl;
                continue;
            }

            try {
                UserCredentials creds;
                creds.username   = username;
                creds.salt       = encoding::hex_to_bytes(salt_hex);
                creds.hash       = encoding::hex_to_bytes(hash_hex);
                creds.iterations = std::stoi(iterations_str);
                loaded[username] = std::move(creds);
            }
            catch (const std::exception& e) {
                std::cerr << "Skipping invalid user record at line " << line_number << ": " << e.what() << std::endl;
            }
        }

        std::lock_guard<std::mutex> lock(users_mutex_);
        users_ = std::move(loaded);
    }

    void CredentialStore::save_users(const std::string& filepath) const
    {
        // one writer at a time; the snapshot is taken after earlier writers finished
        std::lock_guard<std::mutex> file_lock(file_mutex_);

        std::unordered_map<std::string, UserCredentials> snapshot;
        {
            std::lock_guard<std::mutex> lock(users_mutex_);
            snapshot = users_;
        }

        const std::string temp_path = filepath + ".tmp";
        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file.is_open())
                throw std::runtime_error("Failed to open user database for writing");

            file << "# User Database\n";
            file << "# Format: username:salt_hex:hash_hex:iterations\n";

            for (const auto& [username, creds] : snapshot)
            {
                file << username << ":"
                    << encoding::bytes_to_hex(creds.salt) << ":"
                    << encoding::bytes_to_hex(creds.hash) << ":"
                    << creds.iterations << "\n";
            }

            file.close();
            if (!file)
                throw std::runtime_error("Failed to write user database");
        }

        // readers never see a half-written database
        std::error_code ec;
        std::filesystem::rename(temp_path, filepath, ec);
        if (ec)
            throw std::runtime_error("Failed to replace user database: " + ec.message());
    }
} // namespace relay::auth
