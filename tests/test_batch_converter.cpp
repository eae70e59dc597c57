#include <catch2/catch_test_macros.hpp>
#include "batch/batch_converter.hpp"
#include "batch/output_writer.hpp"
#include "batch/path_lock_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <format>
#include <future>
#include <fstream>
#include <iterator>
#include <optional>
#include <thread>
#include <vector>

using namespace ddlbridge;
namespace fs = std::filesystem;

namespace {

// RAII temporary directory
struct TmpDir {
    fs::path path;
    explicit TmpDir(const std::string& name) : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TmpDir() { fs::remove_all(path); }
    fs::path file(const fs::path& rel, const std::string& content) {
        const fs::path p = path / rel;
        fs::create_directories(p.parent_path());
        std::ofstream f(p);
        f << content;
        return p;
    }
};

std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

size_t count_temp_files(const fs::path& dir) {
    size_t n = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.path().extension() == ".tmp") ++n;
    }
    return n;
}

constexpr const char* kOrders = R"(CREATE TABLE [Sales].[Orders] (
    [OrderID] INT NOT NULL DEFAULT (NEXT VALUE FOR [Sequences].[OrderID]),
    [CustomerID] INT NOT NULL,
    CONSTRAINT [PK_Sales_Orders] PRIMARY KEY CLUSTERED ([OrderID] ASC),
    CONSTRAINT [FK_Sales_Orders_CustomerID] FOREIGN KEY ([CustomerID])
        REFERENCES [Sales].[Customers] ([CustomerID])
)
GO
)";

constexpr const char* kCustomers = R"(CREATE TABLE [Sales].[Customers] (
    [CustomerID] INT NOT NULL,
    [CustomerName] NVARCHAR(100) NOT NULL,
    CONSTRAINT [PK_Sales_Customers] PRIMARY KEY CLUSTERED ([CustomerID] ASC)
)
GO
)";

BridgeConfig config_for(const TmpDir& tmp, uint32_t workers = 1) {
    BridgeConfig cfg;
    cfg.input.root = (tmp.path / "in").string();
    cfg.output.root = (tmp.path / "out").string();
    cfg.conversion.workers = workers;
    cfg.conversion.validate_output = false;
    return cfg;
}

void write_input_tree(TmpDir& tmp) {
    tmp.file("in/Sales/Tables/Orders.sql", kOrders);
    tmp.file("in/Sales/Tables/Customers.sql", kCustomers);
    tmp.file("in/Sales/Tables/Broken.sql", "CREATE TABLE [Sales].[Broken] ([x] INT\n");
    tmp.file("in/Sales/Tables/Notes.sql", "SET ANSI_NULLS ON\nGO\n");
    tmp.file("in/Sales/Views/Everything.sql", "CREATE VIEW [Sales].[Everything] AS SELECT 1 AS x\n");
    tmp.file("in/Sequences/Sequences/OrderID.sql",
             "CREATE SEQUENCE [Sequences].[OrderID] AS INT START WITH 1000 INCREMENT BY 1;\n");
}

} // namespace

TEST_CASE("BatchConverter: discovery", "[batch]") {
    TmpDir tmp("ddlbridge_test_discovery");
    write_input_tree(tmp);

    SECTION("Directories are walked for table files only") {
        auto files = BatchConverter::collect_table_files(tmp.path / "in", "tables");
        REQUIRE(files.is_ok());
        REQUIRE(files.value().size() == 4);
        CHECK(files.value()[0].filename().string() == "Broken.sql");
        CHECK(files.value()[3].filename().string() == "Orders.sql");
    }

    SECTION("A single file is taken as given") {
        const fs::path view = tmp.path / "in/Sales/Views/Everything.sql";
        auto files = BatchConverter::collect_table_files(view, "Tables");
        REQUIRE(files.is_ok());
        REQUIRE(files.value().size() == 1);
        CHECK(files.value()[0].string() == view.string());
    }

    SECTION("Missing target") {
        auto files = BatchConverter::collect_table_files(tmp.path / "nope", "Tables");
        REQUIRE(files.is_error());
        CHECK(files.error_category() == ErrorCategory::IO_ERROR);
        CHECK(files.error_message().ends_with("no such file or directory"));
    }

    SECTION("Known tables and sequences") {
        auto known = BatchConverter::scan_known_tables(tmp.path / "in", "Tables");
        CHECK(known.size() == 4);
        CHECK(known.contains(ObjectKey::from("sales", "orders")));
        CHECK_FALSE(known.contains(ObjectKey::from("sales", "everything")));

        auto catalog = BatchConverter::scan_sequences(tmp.path / "in", "Sequences", "_seq");
        CHECK(catalog.size() == 1);
        const auto* seq = catalog.find(QualifiedName("sequences", "order_id_seq"));
        REQUIRE(seq != nullptr);
        CHECK(seq->start == std::optional<std::string>("1000"));
    }
}

TEST_CASE("BatchConverter: converts a tree", "[batch]") {
    TmpDir tmp("ddlbridge_test_batch");
    write_input_tree(tmp);

    BatchConverter converter(config_for(tmp));
    auto summary = converter.run({});

    REQUIRE(summary.files.size() == 4);
    CHECK(summary.converted == 2);
    CHECK(summary.failed == 2);
    CHECK_FALSE(summary.all_ok());

    SECTION("Failures are recorded and do not stop the batch") {
        CHECK(summary.files[0].source.filename().string() == "Broken.sql");
        CHECK(summary.files[0].category == ErrorCategory::PARSE_ERROR);
        CHECK(summary.files[2].source.filename().string() == "Notes.sql");
        CHECK(summary.files[2].category == ErrorCategory::TRANSFORM_ERROR);
        CHECK_FALSE(fs::exists(tmp.path / "out/Sales/Tables/Broken.sql"));
    }

    SECTION("DDL and report land in the output tree") {
        const auto& orders = summary.files[3];
        REQUIRE(orders.success);
        CHECK(orders.table == QualifiedName("Sales", "Orders"));
        CHECK(orders.output.string() == (tmp.path / "out" / "Sales" / "Tables" / "Orders.sql").string());

        const std::string ddl = slurp(tmp.path / "out/Sales/Tables/Orders.sql");
        CHECK(ddl.find("CREATE TABLE sales.orders (") != std::string::npos);
        // Catalog definition, not the best-effort one
        CHECK(ddl.find("CREATE SEQUENCE IF NOT EXISTS sequences.order_id_seq AS INTEGER START 1000 INCREMENT 1;")
              != std::string::npos);

        auto report = nlohmann::json::parse(slurp(tmp.path / "out/Sales/Tables/Orders.report.json"));
        CHECK(report["tables"][0] == "sales.orders");
        CHECK(report["features"]["uses_sequences"] == true);
        CHECK(count_temp_files(tmp.path / "out") == 0);
    }

    SECTION("Dependencies resolve against the snapshot taken at batch start") {
        auto report = nlohmann::json::parse(slurp(tmp.path / "out/Sales/Tables/Orders.report.json"));
        REQUIRE(report.contains("unresolved_dependencies"));
        CHECK(report["unresolved_dependencies"][0]["target"] == "sales.customers");
        CHECK(report["unresolved_dependencies"][0]["in_input_tree"] == true);
        CHECK(summary.files[3].unresolved == 1);

        // A second run sees Customers already converted
        auto again = converter.run({tmp.path / "in/Sales/Tables/Orders.sql"});
        REQUIRE(again.all_ok());
        CHECK(again.files[0].unresolved == 0);
        auto rerun = nlohmann::json::parse(slurp(tmp.path / "out/Sales/Tables/Orders.report.json"));
        CHECK_FALSE(rerun.contains("unresolved_dependencies"));
    }
}

TEST_CASE("BatchConverter: files holding several tables", "[batch]") {
    TmpDir tmp("ddlbridge_test_multi_table");
    tmp.file("in/Sales/Tables/A.sql", R"(CREATE TABLE [Sales].[A] ([AID] INT NOT NULL)
GO
CREATE TABLE [Sales].[B] ([BID] INT NOT NULL)
GO
)");
    tmp.file("in/Sales/Tables/Z.sql", R"(CREATE TABLE [Sales].[Z] (
    [BID] INT NULL,
    CONSTRAINT [FK_Sales_Z_BID] FOREIGN KEY ([BID]) REFERENCES [Sales].[B] ([BID])
)
GO
)");

    BatchConverter converter(config_for(tmp));
    auto first = converter.run({});
    REQUIRE(first.all_ok());
    CHECK(fs::exists(tmp.path / "out/Sales/Tables/A.sql"));
    CHECK_FALSE(fs::exists(tmp.path / "out/Sales/Tables/B.sql"));
    CHECK(first.files[1].unresolved == 1);

    // B is known through A's report on the next run
    auto second = converter.run({tmp.path / "in/Sales/Tables/Z.sql"});
    REQUIRE(second.all_ok());
    CHECK(second.files[0].unresolved == 0);
}

TEST_CASE("BatchConverter: targets and workers", "[batch]") {
    TmpDir tmp("ddlbridge_test_workers");
    write_input_tree(tmp);
    for (int i = 0; i < 12; ++i) {
        tmp.file(std::format("in/Bulk/Tables/T{:02}.sql", i),
                 std::format("CREATE TABLE [Bulk].[T{:02}] ([Id] INT NOT NULL)\n", i));
    }

    SECTION("Outcomes keep input order with several workers") {
        BatchConverter converter(config_for(tmp, 4));
        auto summary = converter.run({tmp.path / "in/Bulk"});
        REQUIRE(summary.files.size() == 12);
        CHECK(summary.all_ok());
        for (size_t i = 0; i < summary.files.size(); ++i) {
            CHECK(summary.files[i].source.filename().string() == std::format("T{:02}.sql", i));
            CHECK(fs::exists(tmp.path / "out/Bulk/Tables" / std::format("T{:02}.sql", i)));
        }
    }

    SECTION("Missing targets fail in place") {
        BatchConverter converter(config_for(tmp));
        auto summary = converter.run({tmp.path / "in/Sales/Tables/Customers.sql",
                                      tmp.path / "in/Missing",
                                      tmp.path / "in/Sales/Tables/Orders.sql"});
        REQUIRE(summary.files.size() == 3);
        CHECK(summary.files[0].success);
        CHECK(summary.files[1].category == ErrorCategory::IO_ERROR);
        CHECK(summary.files[2].success);
        CHECK(summary.failed == 1);
    }
}

TEST_CASE("PathLockRegistry: one mutex per path", "[batch][locks]") {
    PathLockRegistry registry;

    SECTION("Paths are keyed case-insensitively after normalization") {
        { auto g = registry.acquire("out/Sales/Tables/Orders.sql"); }
        { auto g = registry.acquire("out/sales/./Tables/ORDERS.sql"); }
        CHECK(registry.size() == 1);
        { auto g = registry.acquire("out/Sales/Tables/Customers.sql"); }
        CHECK(registry.size() == 2);
    }

    SECTION("Holders of the same path are serialized") {
        int counter = 0;
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 1000; ++i) {
                    auto guard = registry.acquire("out/dbo/Tables/T.sql");
                    ++counter;
                }
            });
        }
        for (auto& th : threads) th.join();
        CHECK(counter == 8000);
        CHECK(registry.size() == 1);
    }

    SECTION("Waiting on a busy path does not block other paths") {
        std::optional<PathLockRegistry::Guard> held;
        held.emplace(registry.acquire("out/dbo/Tables/Busy.sql"));

        std::thread waiter([&] { auto g = registry.acquire("out/dbo/Tables/Busy.sql"); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        auto other = std::async(std::launch::async, [&] {
            auto g = registry.acquire("out/dbo/Tables/Fresh.sql");
            return true;
        });
        CHECK(other.wait_for(std::chrono::seconds(2)) == std::future_status::ready);

        held.reset();
        waiter.join();
        CHECK(other.get());
        CHECK(registry.size() == 2);
    }
}

TEST_CASE("OutputWriter: atomic replacement", "[batch][writer]") {
    TmpDir tmp("ddlbridge_test_writer");
    PathLockRegistry locks;
    OutputWriter writer(locks);

    const fs::path ddl = tmp.path / "out/Sales/Tables/Orders.sql";
    const fs::path report = tmp.path / "out/Sales/Tables/Orders.report.json";

    SECTION("Creates directories and both files") {
        auto result = writer.write(ddl, "CREATE TABLE sales.orders ();\n", report, "{}\n");
        REQUIRE(result.is_ok());
        CHECK(slurp(ddl) == "CREATE TABLE sales.orders ();\n");
        CHECK(slurp(report) == "{}\n");
        CHECK(count_temp_files(tmp.path) == 0);
    }

    SECTION("Rewrites replace previous output") {
        REQUIRE(writer.write(ddl, "old\n", report, "{\"v\":1}\n").is_ok());
        REQUIRE(writer.write(ddl, "new\n", report, "{\"v\":2}\n").is_ok());
        CHECK(slurp(ddl) == "new\n");
        CHECK(slurp(report) == "{\"v\":2}\n");
    }

    SECTION("An unwritable location fails without leaving a DDL behind") {
        tmp.file("blocker", "not a directory");
        const fs::path bad_ddl = tmp.path / "blocker/Tables/T.sql";
        auto result = writer.write(bad_ddl, "x", tmp.path / "blocker/Tables/T.report.json", "{}");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
        CHECK_FALSE(fs::exists(bad_ddl));
        CHECK_FALSE(fs::exists(tmp.path / "blocker/Tables/T.report.json"));
    }

    SECTION("A DDL that cannot land leaves no new report behind") {
        // A directory in the DDL's place makes the final rename fail
        tmp.file("out/Sales/Tables/Orders.sql/keep", "x");
        auto result = writer.write(ddl, "new\n", report, "{\"v\":2}\n");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::IO_ERROR);
        CHECK_FALSE(fs::exists(report));
        CHECK(count_temp_files(tmp.path) == 0);
    }

    SECTION("A DDL that cannot land keeps the previous report") {
        tmp.file("out/Sales/Tables/Orders.report.json", "{\"v\":1}\n");
        tmp.file("out/Sales/Tables/Orders.sql/keep", "x");
        auto result = writer.write(ddl, "new\n", report, "{\"v\":2}\n");
        REQUIRE(result.is_error());
        CHECK(slurp(report) == "{\"v\":1}\n");

        size_t leftovers = 0;
        for (const auto& entry : fs::directory_iterator(tmp.path / "out/Sales/Tables")) {
            if (entry.path().filename().string().starts_with(".")) ++leftovers;
        }
        CHECK(leftovers == 0);
    }
}
