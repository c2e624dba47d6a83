#include "blob_store.hpp"
#include <glib.h>

namespace Marquee {

FileBlobStore::FileBlobStore(const std::string& directory)
    : directory_(directory.empty() ? default_directory() : directory) {
    g_mkdir_with_parents(directory_.c_str(), 0755);
}

std::string FileBlobStore::default_directory() {
    const char* data_dir = g_get_user_data_dir();
    return std::string(data_dir) + "/marquee";
}

std::string FileBlobStore::path_for(const std::string& key) const {
    return directory_ + "/" + key + ".json";
}

std::optional<std::string> FileBlobStore::load(const std::string& key) {
    std::string path = path_for(key);
    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        return std::nullopt;
    }

    gchar* contents = nullptr;
    gsize length = 0;
    g_autoptr(GError) error = nullptr;

    if (!g_file_get_contents(path.c_str(), &contents, &length, &error)) {
        g_warning("[Store] Failed to read %s: %s", path.c_str(), error->message);
        return std::nullopt;
    }

    std::string blob(contents, length);
    g_free(contents);
    return blob;
}

bool FileBlobStore::save(const std::string& key, const std::string& blob) {
    std::string path = path_for(key);
    g_autoptr(GError) error = nullptr;

    if (!g_file_set_contents(path.c_str(), blob.data(), static_cast<gssize>(blob.size()), &error)) {
        g_warning("[Store] Failed to write %s: %s", path.c_str(), error->message);
        return false;
    }
    return true;
}

} // namespace Marquee
