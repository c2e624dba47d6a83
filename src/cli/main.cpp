#include "marquee/blob_store.hpp"
#include "marquee/catalog_service.hpp"
#include "marquee/clock.hpp"
#include "marquee/http_fetcher.hpp"
#include "marquee/settings.hpp"
#include <glib.h>
#include <gio/gio.h>
#include <cstdlib>
#include <string>

namespace {

gchar* opt_add = nullptr;
gchar* opt_name = nullptr;
gint opt_priority = 0;
gchar* opt_remove = nullptr;
gchar* opt_enable = nullptr;
gchar* opt_disable = nullptr;
gchar* opt_primary = nullptr;
gchar* opt_check = nullptr;
gchar* opt_search = nullptr;
gchar* opt_category = nullptr;
gchar* opt_settings = nullptr;
gchar* opt_data_dir = nullptr;
gboolean opt_list = FALSE;
gboolean opt_refresh = FALSE;
gboolean opt_directory = FALSE;
gboolean opt_stats = FALSE;

const GOptionEntry kEntries[] = {
    { "add", 'a', 0, G_OPTION_ARG_STRING, &opt_add, "Register a config source", "URL" },
    { "name", 'n', 0, G_OPTION_ARG_STRING, &opt_name, "Display name for --add", "NAME" },
    { "priority", 'p', 0, G_OPTION_ARG_INT, &opt_priority, "Priority for --add", "N" },
    { "remove", 0, 0, G_OPTION_ARG_STRING, &opt_remove, "Remove a source", "ID" },
    { "enable", 0, 0, G_OPTION_ARG_STRING, &opt_enable, "Enable a source", "ID" },
    { "disable", 0, 0, G_OPTION_ARG_STRING, &opt_disable, "Disable a source", "ID" },
    { "primary", 0, 0, G_OPTION_ARG_STRING, &opt_primary, "Mark a source as primary", "ID" },
    { "check", 0, 0, G_OPTION_ARG_STRING, &opt_check, "Fetch a source and report its health", "ID" },
    { "list", 'l', 0, G_OPTION_ARG_NONE, &opt_list, "List sources", nullptr },
    { "refresh", 'r', 0, G_OPTION_ARG_NONE, &opt_refresh, "Re-fetch every source", nullptr },
    { "directory", 'd', 0, G_OPTION_ARG_NONE, &opt_directory, "Print the aggregated directory", nullptr },
    { "search", 's', 0, G_OPTION_ARG_STRING, &opt_search, "Search sites", "KEYWORD" },
    { "category", 'c', 0, G_OPTION_ARG_STRING, &opt_category, "List sites of a category", "KIND" },
    { "stats", 0, 0, G_OPTION_ARG_NONE, &opt_stats, "Print statistics", nullptr },
    { "settings", 0, 0, G_OPTION_ARG_FILENAME, &opt_settings, "Settings file", "PATH" },
    { "data-dir", 0, 0, G_OPTION_ARG_FILENAME, &opt_data_dir, "Data directory", "DIR" },
    { nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr }
};

bool report(const Marquee::Error& error, const char* what) {
    if (error) {
        g_printerr("%s failed: %s\n", what, error.to_string().c_str());
        return false;
    }
    return true;
}

void print_sources(const Marquee::CatalogService& service) {
    for (const auto& source : service.sources()) {
        g_print("%s  %-8s %s%s  prio=%d  %s\n  %s\n",
                source.id.c_str(),
                Catalog::health_status_to_string(source.health_status),
                source.enabled ? "" : "[disabled] ",
                source.is_primary ? "[primary]" : "",
                source.priority,
                source.name.c_str(),
                source.url.c_str());
    }
}

void print_directory(const Catalog::AggregatedDirectory& directory, bool stale) {
    g_print("%d sites from %d sources%s\n",
            directory.unique_site_count(), directory.source_count, stale ? " (stale)" : "");

    for (const auto& category : directory.categories) {
        g_print("\n%s (%zu)\n", category.name.c_str(), category.site_keys.size());
        for (const auto& key : category.site_keys) {
            const auto* entry = directory.find(key);
            if (!entry) continue;
            g_print("  %-24s %-32s q=%.2f  sources=%zu\n",
                    entry->site.key.c_str(), entry->site.name.c_str(),
                    entry->quality_score, entry->origin_urls.size());
        }
    }

    for (const auto& failure : directory.failures) {
        g_print("\n! %s: %s%s\n", failure.source_url.c_str(), failure.message.c_str(),
                failure.served_stale ? " (served cached copy)" : "");
    }
}

void print_statistics(const Marquee::Statistics& stats) {
    g_print("Sources:        %d (%d active)\n", stats.total_sources, stats.active_sources);
    g_print("Sites:          %d (%d unique)\n", stats.total_sites, stats.unique_sites);
    g_print("Last refresh:   %" G_GINT64_FORMAT "\n", stats.last_aggregation);
    g_print("Avg response:   %.0f ms\n", stats.average_response_time_ms);
    g_print("Success rate:   %.1f%%\n", stats.success_rate * 100.0);
    g_print("Cache hit rate: %.1f%%\n", stats.cache_hit_rate * 100.0);
}

} // namespace

int main(int argc, char* argv[]) {
    g_autoptr(GOptionContext) context = g_option_context_new("- aggregate video site config sources");
    g_option_context_add_main_entries(context, kEntries, nullptr);

    g_autoptr(GError) error = nullptr;
    if (!g_option_context_parse(context, &argc, &argv, &error)) {
        g_printerr("%s\n", error->message);
        return EXIT_FAILURE;
    }

    std::string settings_path = opt_settings ? opt_settings : Marquee::Settings::default_path();
    Marquee::Settings settings = Marquee::Settings::load_from_file(settings_path);

    Marquee::SoupFetcher fetcher(settings.user_agent, static_cast<guint>(settings.fetch_timeout_ms));
    Marquee::FileBlobStore store(opt_data_dir ? opt_data_dir : "");
    Marquee::SystemClock clock;
    Marquee::CatalogService service(fetcher, store, clock, nullptr, settings);
    service.open();

    bool ok = true;

    if (opt_add) {
        ok = report(service.register_source(opt_add, opt_name ? opt_name : "", opt_priority), "Adding source") && ok;
        if (ok) g_print("Added %s\n", Marquee::CatalogService::make_source_id(opt_add).c_str());
    }
    if (opt_remove) ok = report(service.remove_source(opt_remove), "Removing source") && ok;
    if (opt_enable) ok = report(service.set_source_enabled(opt_enable, true), "Enabling source") && ok;
    if (opt_disable) ok = report(service.set_source_enabled(opt_disable, false), "Disabling source") && ok;
    if (opt_primary) ok = report(service.set_primary_source(opt_primary), "Setting primary") && ok;

    if (opt_list) {
        print_sources(service);
    }

    GMainLoop* loop = g_main_loop_new(nullptr, FALSE);
    bool done = false;

    if (opt_check) {
        service.check_source_health(opt_check, nullptr,
                                    [&ok, &done, loop](std::optional<Marquee::SourceHealth> health, const Marquee::Error& err) {
            if (!health) {
                ok = report(err, "Health check") && ok;
            } else {
                g_print("%s: %s, %d sites, reliability %.2f%s%s\n",
                        health->source_id.c_str(),
                        Catalog::health_status_to_string(health->status),
                        health->site_count,
                        health->reliability,
                        health->error ? ", last error: " : "",
                        health->error ? health->error.message.c_str() : "");
            }
            done = true;
            g_main_loop_quit(loop);
        });
        // Unknown ids answer before the loop starts
        if (!done) g_main_loop_run(loop);
    }

    bool wants_directory = opt_refresh || opt_directory || opt_search || opt_category || opt_stats;
    if (wants_directory) {
        done = false;
        service.get_directory(opt_refresh, nullptr,
                              [&ok, &done, loop](Catalog::DirectoryPtr directory, bool stale, const Marquee::Error& err) {
            if (!directory) {
                ok = report(err, "Aggregation") && ok;
            } else if (opt_directory || opt_refresh) {
                print_directory(*directory, stale);
            }
            done = true;
            g_main_loop_quit(loop);
        });
        if (!done) g_main_loop_run(loop);
    }

    if (opt_search) {
        for (const auto& match : service.search_sites(opt_search)) {
            g_print("%5.2f  %-24s %s\n", match.relevance, match.entry.site.key.c_str(), match.entry.site.name.c_str());
        }
    }

    if (opt_category) {
        for (const auto& entry : service.sites_by_category(opt_category)) {
            g_print("%-24s %s\n", entry.site.key.c_str(), entry.site.name.c_str());
        }
    }

    if (opt_stats) {
        print_statistics(service.get_statistics());
    }

    service.close();
    g_main_loop_unref(loop);

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
