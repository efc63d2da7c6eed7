#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <unordered_map>

namespace relay::auth
{
    constexpr size_t kSaltSize          = 16; // 128-bit salt
    constexpr size_t kHashSize          = 32; // SHA-256 output
    constexpr int kDefaultIterations    = 100000;

    // credential collaborator consumed by the router
    class AuthService
    {
    public:
        virtual ~AuthService() = default;

        virtual bool register_user(const std::string& username, const std::string& password) = 0;
        virtual bool verify(const std::string& username, const std::string& password) = 0;
    };

    // user credentials stored on server
    struct UserCredentials
    {
        std::string username;
        std::vector<uint8_t> salt; // random salt
        std::vector<uint8_t> hash; // PBKDF2-HMAC-SHA256(password, salt)
        int iterations{kDefaultIterations};
    };

    /**
     * Salted slow-hash credential store.
     * Optionally backed by a text file that is loaded on construction
     * and rewritten after every successful registration.
     */
    class CredentialStore : public AuthService
    {
    private:
        std::unordered_map<std::string, UserCredentials> users_;
        mutable std::mutex users_mutex_;
        mutable std::mutex file_mutex_;

        std::string db_path_;
        int iterations_;

    public:
        explicit CredentialStore(std::string db_path = "", int iterations = kDefaultIterations);

        bool register_user(const std::string& username, const std::string& password) override;
        bool verify(const std::string& username, const std::string& password) override;

        [[nodiscard]] size_t user_count() const;

        // load/save user database
        void load_users(const std::string& filepath);
        void save_users(const std::string& filepath) const;

        static std::vector<uint8_t> derive_hash(const std::string& password,
                                                const std::vector<uint8_t>& salt,
                                                int iterations);
    };
} // namespace relay::auth
