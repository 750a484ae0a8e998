#include <FileJsonStorage.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace NReservation {

    TFileJsonStorage::TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath)
        : SnapshotPath(std::move(snapshotPath))
        , JournalPath(std::move(journalPath)) {
    }

    void TFileJsonStorage::AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j) {
        std::error_code ec;
        auto tmp = path;
        tmp += ".tmp";

        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot open temp file for writing: " + tmp.string());
        }
        ofs << j.dump(2);
        ofs.close();
        if (!ofs) {
            throw std::runtime_error("Failed writing snapshot: " + tmp.string());
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::filesystem::remove(tmp);
            throw std::runtime_error("Atomic rename failed: " + ec.message());
        }
    }

    void TFileJsonStorage::SaveState(const nlohmann::json& snapshot) {
        std::scoped_lock lk(Mutex_);
        if (!SnapshotPath.parent_path().empty()) {
            std::filesystem::create_directories(SnapshotPath.parent_path());
        }
        AtomicWrite(SnapshotPath, snapshot);
    }

    nlohmann::json TFileJsonStorage::LoadState() {
        std::scoped_lock lk(Mutex_);
        if (!std::filesystem::exists(SnapshotPath)) {
            return nlohmann::json::object();
        }
        std::ifstream ifs(SnapshotPath);
        if (!ifs) {
            throw std::runtime_error("Cannot open snapshot file: " + SnapshotPath.string());
        }
        nlohmann::json j;
        ifs >> j;
        return j;
    }

    void TFileJsonStorage::AppendJournal(const nlohmann::json& entry) {
        std::scoped_lock lk(Mutex_);
        if (!JournalPath.parent_path().empty()) {
            std::filesystem::create_directories(JournalPath.parent_path());
        }
        std::ofstream ofs(JournalPath, std::ios::app);
        if (!ofs) {
            throw std::runtime_error("Cannot open journal file for append: " + JournalPath.string());
        }
        ofs << entry.dump() << '\n';
    }

    std::vector<nlohmann::json> TFileJsonStorage::LoadJournal() {
        std::scoped_lock lk(Mutex_);
        std::vector<nlohmann::json> out;
        if (!std::filesystem::exists(JournalPath)) {
            return out;
        }
        std::ifstream ifs(JournalPath);
        std::string line;
        while (std::getline(ifs, line)) {
            if (line.empty()) {
                continue;
            }
            // A torn last line from a crash mid-append ends the journal.
            auto entry = nlohmann::json::parse(line, nullptr, false);
            if (entry.is_discarded()) {
                break;
            }
            out.push_back(std::move(entry));
        }
        return out;
    }

} // namespace NReservation
