#pragma once

#include <jsonsync/serialization/ISerializer.hpp>
#include <jsonsync/IMapBackend.hpp>
#include <jsonsync/StoreError.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

/**
 * @brief Персистентность на основе полного снимка (snapshot)
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Стратегия:
 * - load() — читает весь файл; нет файла или он пустой → пустой снимок
 * - save() — сериализует весь снимок и атомарно заменяет файл
 *
 * Атомарность записи: данные пишутся в соседний временный файл
 * (<имя>.<расширение>.tmp), затем rename поверх целевого. Наблюдатель
 * видит либо старое, либо новое содержимое целиком — при условии,
 * что rename атомарен на данной файловой системе (на сетевых ФС
 * и при переносе между устройствами гарантий нет).
 *
 * Записи внутри процесса сериализуются мьютексом: общий .tmp не пишут
 * два потока сразу, а saveFrom() снимает снимок уже под мьютексом, поэтому
 * более старый снимок не может перезаписать более новый. Писателей
 * в map этот мьютекс не блокирует.
 *
 * Межпроцессных блокировок нет: один файл — один процесс.
 * Если процесс упал между записью и rename, .tmp останется на диске.
 */
template<typename K, typename V>
class SnapshotPersistence {
public:
    using Snapshot = typename ISerializer<K, V>::Snapshot;

    /**
     * @brief Конструктор
     * @param filePath Путь к файлу snapshot
     * @param serializer Сериализатор данных
     */
    SnapshotPersistence(std::filesystem::path filePath,
                        std::shared_ptr<ISerializer<K, V>> serializer)
        : filePath_(std::move(filePath))
        , serializer_(std::move(serializer))
    {
        if (!serializer_) {
            throw ConfigError("serializer cannot be null");
        }
    }

    /**
     * @brief Загрузить снимок из файла
     * @return Вектор пар ключ-значение
     * @throws IoError при ошибке чтения
     * @throws DeserializeError если содержимое повреждено
     */
    Snapshot load() const {
        std::error_code ec;
        auto status = std::filesystem::status(filePath_, ec);
        if (status.type() == std::filesystem::file_type::not_found) {
            // Первый запуск
            return {};
        }
        if (ec) {
            throw IoError("failed to stat " + filePath_.string() + ": " + ec.message());
        }
        if (std::filesystem::is_directory(status)) {
            throw IoError("is a directory: " + filePath_.string());
        }

        std::ifstream file(filePath_, std::ios::binary);
        if (!file) {
            throw IoError("failed to open file for reading: " + filePath_.string());
        }

        // Получаем размер файла
        file.seekg(0, std::ios::end);
        std::streamoff fileSize = file.tellg();
        file.seekg(0, std::ios::beg);

        if (fileSize < 0) {
            throw IoError("failed to determine size of file: " + filePath_.string());
        }
        if (fileSize == 0) {
            // Пустой (например усечённый) файл — то же, что {}
            return {};
        }

        std::vector<uint8_t> data(static_cast<size_t>(fileSize));
        file.read(reinterpret_cast<char*>(data.data()), fileSize);

        if (!file) {
            throw IoError("failed to read file: " + filePath_.string());
        }

        return serializer_->deserialize(data);
    }

    /**
     * @brief Сохранить снимок целиком
     * @throws SerializeError если данные нельзя закодировать
     * @throws IoError при ошибке записи
     */
    void save(const Snapshot& entries) const {
        std::lock_guard<std::mutex> lock(writeMutex_);
        atomicWrite(filePath_, serializer_->serialize(entries));
    }

    /**
     * @brief Снять снимок с map и сохранить его
     * @param source Источник данных
     * @return Количество записанных записей
     * @throws SerializeError, IoError
     */
    size_t saveFrom(const IMapBackend<K, V>& source) const {
        std::lock_guard<std::mutex> lock(writeMutex_);
        Snapshot snapshot = source.snapshot();
        atomicWrite(filePath_, serializer_->serialize(snapshot));
        return snapshot.size();
    }

    /**
     * @brief Атомарно записать байты в файл (temp + rename)
     * @param path Целевой файл
     * @param bytes Содержимое
     * @throws IoError при ошибке записи или переименования
     */
    static void atomicWrite(const std::filesystem::path& path,
                            const std::vector<uint8_t>& bytes) {
        const std::filesystem::path tempPath = tempPathFor(path);

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw IoError("failed to open temp file for writing: " + tempPath.string());
            }

            file.write(reinterpret_cast<const char*>(bytes.data()),
                       static_cast<std::streamsize>(bytes.size()));
            file.flush();

            if (!file) {
                file.close();
                discardTemp(tempPath);
                throw IoError("failed to write temp file: " + tempPath.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            discardTemp(tempPath);
            throw IoError("failed to rename " + tempPath.string() + " to " +
                          path.string() + ": " + ec.message());
        }
    }

    /**
     * @brief Путь временного файла для атомарной записи
     *
     * db.json → db.json.tmp; без расширения: db → db.json.tmp
     */
    static std::filesystem::path tempPathFor(const std::filesystem::path& path) {
        std::string extension = path.extension().string();
        if (extension.empty()) {
            extension = ".json";
        }
        std::filesystem::path tempPath = path;
        tempPath.replace_extension(extension + ".tmp");
        return tempPath;
    }

    /**
     * @brief Проверить существование файла
     */
    bool exists() const {
        std::error_code ec;
        return std::filesystem::exists(filePath_, ec);
    }

    /**
     * @brief Получить путь к файлу
     */
    const std::filesystem::path& filePath() const {
        return filePath_;
    }

private:
    static void discardTemp(const std::filesystem::path& tempPath) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
    }

    std::filesystem::path filePath_;
    std::shared_ptr<ISerializer<K, V>> serializer_;
    mutable std::mutex writeMutex_;
};
