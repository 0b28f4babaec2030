#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <stop_token>
#include <vector>

#include "inventory/config.h"
#include "inventory/errors.h"
#include "inventory/inventory.h"
#include "inventory/logging.h"
#include "inventory/object_record.h"
#include "inventory/s3_client.hpp"
#include "inventory/shard_reader.h"

using namespace std;
using namespace inventory;

namespace
{

// Set by the signal handler; forwarded to g_stop from the batch loop
volatile sig_atomic_t g_interrupted = 0;
stop_source g_stop;

void on_sigint(int)
{
    g_interrupted = 1;
}

struct CurlGlobal
{
    CurlGlobal() { s3_global_init(); }
    ~CurlGlobal() { s3_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void write_row(ostream& out, const ObjectRecord& r)
{
    out << r.bucket << ';' << r.key << ';' << r.size << ';' << r.last_modified << ';' << r.checksum << '\n';
}

} // namespace

int main(int argc, char** argv)
{
    if (argc > 3)
    {
        cerr << "usage: " << argv[0] << " [config.json] [output.csv]" << endl;
        return 2;
    }
    const string config_path = argc > 1 ? argv[1] : "config.json";

    AppConfig cfg;
    try
    {
        cfg = load_config(config_path);
    }
    catch (const ConfigError& e)
    {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    init_logger(cfg.log_path);
    signal(SIGINT, on_sigint);

    ofstream file;
    if (argc > 2)
    {
        file.open(argv[2], ios::out | ios::trunc);
        if (!file.is_open())
        {
            log_error(string("cannot open output ") + argv[2]);
            return 1;
        }
    }
    ostream& out = argc > 2 ? static_cast<ostream&>(file) : cout;

    try
    {
        CurlGlobal curl;
        unique_ptr<IObjectStore> store = make_object_store(cfg.store);
        ShardReaderFactory factory(*store, cfg.tmp_dir);
        Inventory inv = Inventory::generate(cfg.manifest_url, *store, factory, cfg.inventory);

        log_message("inventory of " + inv.source_name() + " from " + inv.inventory_url() +
                    ": " + to_string(inv.shard_count()) + " shards" + (inv.sorted() ? "" : " (unsorted)"));

        unique_ptr<InventoryIterator> it = inv.iterator(g_stop.get_token());
        vector<ObjectRecord> batch(cfg.batch_size);
        size_t total = 0;

        out << "bucket;key;size;last_modified;checksum\n";
        for (;;)
        {
            if (g_interrupted) g_stop.request_stop();
            const size_t n = it->next_batch(batch);
            if (n == 0) break;
            for (size_t i = 0; i < n; ++i) write_row(out, batch[i]);
            total += n;
        }
        out.flush();
        if (!out)
        {
            log_error("failed writing output");
            return 1;
        }
        log_message("wrote " + to_string(total) + " records");
    }
    catch (const CancelledError& e)
    {
        out.flush();
        log_warning(e.what());
        return 130;
    }
    catch (const exception& e)
    {
        log_error(string("Exception caught: ") + e.what());
        return 1;
    }
    return 0;
}
