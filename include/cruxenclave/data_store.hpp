#ifndef CRUXENCLAVE_DATA_STORE_HPP
#define CRUXENCLAVE_DATA_STORE_HPP

#include "codec.hpp"

#include <filesystem>
#include <map>
#include <mutex>

namespace CruxEnclave {

    /**
     * @brief A key-value byte store.
     *
     * Implementations own their durability and concurrency guarantees; a get issued
     * after a put of the same key on the same store must observe the written value.
     */
    class DataStore {
    public:
        virtual ~DataStore() = default;

        virtual void put(const byte_vector& key, const byte_vector& value) = 0;

        /**
         * @throws CruxEnclave::NotFound if the key is absent.
         */
        virtual byte_vector get(const byte_vector& key) const = 0;

        /**
         * @throws CruxEnclave::NotFound if the key is absent.
         */
        virtual void remove(const byte_vector& key) = 0;

        virtual bool contains(const byte_vector& key) const = 0;
    };

    /**
     * @brief Keeps everything in a map guarded by a mutex. Contents die with the process.
     */
    class MemoryDataStore : public DataStore {
    public:
        void put(const byte_vector& key, const byte_vector& value) override;
        byte_vector get(const byte_vector& key) const override;
        void remove(const byte_vector& key) override;
        bool contains(const byte_vector& key) const override;

        size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<byte_vector, byte_vector> entries_;
    };

    /**
     * @brief Stores one file per key under a base directory.
     *
     * Layout: {base}/{hex[0:2]}/{hex[2:4]}/{remaining hex}. Writes go to a
     * temporary file that is renamed into place.
     */
    class FileDataStore : public DataStore {
    public:
        /**
         * @throws CruxEnclave::RuntimeError if the base directory cannot be created.
         */
        explicit FileDataStore(std::filesystem::path base_path);

        void put(const byte_vector& key, const byte_vector& value) override;
        byte_vector get(const byte_vector& key) const override;
        void remove(const byte_vector& key) override;
        bool contains(const byte_vector& key) const override;

        const std::filesystem::path& base_path() const { return base_path_; }

    private:
        std::filesystem::path path_for_key(const byte_vector& key) const;

        std::filesystem::path base_path_;
    };

} // namespace CruxEnclave

#endif // CRUXENCLAVE_DATA_STORE_HPP
