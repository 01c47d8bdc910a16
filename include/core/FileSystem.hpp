// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef FILE_SYSTEM_HPP
#define FILE_SYSTEM_HPP

#include <filesystem>
#include <system_error>

namespace Preflight::Core {

    /**
     * @brief Vékony absztrakció a munkakönyvtár állapotának vizsgálatához.
     * A tesztek memóriabeli implementációt adnak helyette.
     */
    class FileSystem {
    public:
        virtual ~FileSystem() = default;

        // Létezik-e bármilyen bejegyzés (symlink követése nélkül, a törött linket is látja).
        // A hiány nem hiba; minden más lekérdezési hiba ec-be kerül, ilyenkor false.
        virtual bool entryExists(const std::filesystem::path& p, std::error_code& ec) const = 0;

        // Symlinket követ; hibakezelés mint entryExists-nél
        virtual bool isDirectory(const std::filesystem::path& p, std::error_code& ec) const = 0;
        virtual bool isRegularFile(const std::filesystem::path& p) const = 0;
        virtual bool isExecutable(const std::filesystem::path& p) const = 0;

        // Egyetlen nem-könyvtár bejegyzés törlése
        virtual bool removeEntry(const std::filesystem::path& p, std::error_code& ec) = 0;
    };

    class LocalFileSystem final : public FileSystem {
    public:
        bool entryExists(const std::filesystem::path& p, std::error_code& ec) const override;
        bool isDirectory(const std::filesystem::path& p, std::error_code& ec) const override;
        bool isRegularFile(const std::filesystem::path& p) const override;
        bool isExecutable(const std::filesystem::path& p) const override;
        bool removeEntry(const std::filesystem::path& p, std::error_code& ec) override;
    };
}

#endif
