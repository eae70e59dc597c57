#include <catch2/catch_test_macros.hpp>
#include "core/pipeline.hpp"
#include "mocks/mock_conversion_state.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ddlbridge;
using ddlbridge::testing::MockConversionState;

namespace {

PipelineComponents components(const IConversionState& state, bool validate = false) {
    PipelineComponents c;
    c.state = &state;
    c.validate_output = validate;
    return c;
}

FileConversion convert_ok(const ConversionPipeline& pipeline, std::string_view text) {
    auto result = pipeline.convert(text, "Sales/Tables/Orders.sql");
    INFO(result.error_message());
    REQUIRE(result.is_ok());
    return result.value();
}

constexpr std::string_view kOrders = R"(
SET ANSI_NULLS ON
GO
CREATE TABLE [Sales].[Orders] (
    [OrderID] INT DEFAULT (NEXT VALUE FOR [Sequences].[OrderID]),
    [CustomerID] INT NOT NULL,
    CONSTRAINT [PK_Sales_Orders] PRIMARY KEY CLUSTERED ([OrderID] ASC),
    CONSTRAINT [FK_Sales_Orders_CustomerID] FOREIGN KEY ([CustomerID])
        REFERENCES [Sales].[Customers] ([CustomerID])
)
GO
)";

} // namespace

TEST_CASE("EndToEnd: Sales.Orders", "[e2e]") {

    MockConversionState state;
    const ConversionPipeline pipeline(components(state));
    const auto conv = convert_ok(pipeline, kOrders);

    SECTION("Canonical DDL") {
        const std::string expected =
            "CREATE SCHEMA IF NOT EXISTS sales;\n"
            "\n"
            "CREATE SCHEMA IF NOT EXISTS sequences;\n"
            "\n"
            "CREATE SEQUENCE IF NOT EXISTS sequences.order_id_seq START 1 INCREMENT 1;\n"
            "\n"
            "CREATE TABLE sales.orders (\n"
            "    OrderID    INTEGER        DEFAULT nextval('sequences.order_id_seq'),\n"
            "    CustomerID INTEGER        NOT NULL,\n"
            "    CONSTRAINT PK_Sales_Orders PRIMARY KEY (OrderID),\n"
            "    CONSTRAINT FK_Sales_Orders_CustomerID FOREIGN KEY (CustomerID) REFERENCES sales.customers (CustomerID)\n"
            ");\n";
        CHECK(conv.primary_table == QualifiedName("Sales", "Orders"));
        CHECK(conv.ddl.starts_with(expected + "\n-- REVIEW: "));
        // SET options are kept as a review block after the table
        CHECK(conv.ddl.ends_with("\n-- SET ANSI_NULLS ON\n"));
    }

    SECTION("Unresolved dependency on the referenced table") {
        REQUIRE(conv.report.unresolved.size() == 1);
        const auto& group = conv.report.unresolved[0];
        CHECK(group.target == ObjectKey::from("sales", "customers"));
        CHECK(group.columns == std::vector<std::string>{"CustomerID"});
        CHECK(group.referenced_by == std::vector<ObjectKey>{ObjectKey::from("sales", "orders")});
    }

    SECTION("Report") {
        CHECK(conv.report.source_path == "Sales/Tables/Orders.sql");
        CHECK(conv.report.tables == std::vector<std::string>{"sales.orders"});
        CHECK(conv.report.flags.uses_sequences);
        CHECK(std::ranges::any_of(conv.report.diagnostics, [](const Diagnostic& d) {
            return d.kind == DiagnosticKind::MISSING_SEQUENCE_DEFINITION;
        }));
        CHECK(conv.report_json.find("\"unresolved_dependencies\"") != std::string::npos);
    }
}

TEST_CASE("EndToEnd: converted dependencies are not reported", "[e2e]") {

    MockConversionState state{ObjectKey::from("sales", "customers")};
    const ConversionPipeline pipeline(components(state));
    const auto conv = convert_ok(pipeline, kOrders);

    CHECK(conv.report.unresolved.empty());
    CHECK(conv.report_json.find("unresolved_dependencies") == std::string::npos);
}

TEST_CASE("EndToEnd: several tables in one file", "[e2e]") {

    MockConversionState state;
    const ConversionPipeline pipeline(components(state));
    const auto conv = convert_ok(pipeline, R"(
CREATE TABLE [Sales].[A] (
    [AID] INT NOT NULL,
    [BID] INT NULL,
    CONSTRAINT [FK_Sales_A_BID] FOREIGN KEY ([BID]) REFERENCES [Sales].[B] ([BID])
)
GO
CREATE TABLE [Sales].[B] (
    [BID] INT NOT NULL,
    [CID] INT NULL,
    CONSTRAINT [FK_Sales_B_CID] FOREIGN KEY ([CID]) REFERENCES [Sales].[C] ([CID])
)
GO
)");

    CHECK(conv.primary_table == QualifiedName("Sales", "A"));
    CHECK(conv.report.tables == std::vector<std::string>{"sales.a", "sales.b"});

    // B is written by this file, only C is still missing
    REQUIRE(conv.report.unresolved.size() == 1);
    CHECK(conv.report.unresolved[0].target == ObjectKey::from("sales", "c"));
    CHECK(conv.report.unresolved[0].referenced_by == std::vector<ObjectKey>{ObjectKey::from("sales", "b")});
}

TEST_CASE("EndToEnd: reserved column names stay valid PostgreSQL", "[e2e]") {

    MockConversionState state;
    const ConversionPipeline pipeline(components(state, true));
    const auto conv = convert_ok(pipeline, R"(
CREATE TABLE [dbo].[Order] (
    [Order] INT NOT NULL,
    [User] NVARCHAR(50) NULL,
    CONSTRAINT [PK_Order] PRIMARY KEY CLUSTERED ([Order] ASC),
    CONSTRAINT [CK_Order_Order] CHECK ([Order] > 0)
)
GO
)");

    CHECK(conv.ddl.find("CREATE TABLE dbo.\"order\" (") != std::string::npos);
    CHECK(conv.ddl.find("    \"Order\" INTEGER") != std::string::npos);
    CHECK(conv.ddl.find("PRIMARY KEY (\"Order\")") != std::string::npos);
    CHECK(conv.ddl.find("(\"Order\" > 0)") != std::string::npos);
    CHECK(std::ranges::none_of(conv.report.diagnostics, [](const Diagnostic& d) {
        return d.kind == DiagnosticKind::OUTPUT_VALIDATION;
    }));
}

TEST_CASE("EndToEnd: failures", "[e2e]") {

    MockConversionState state;
    const ConversionPipeline pipeline(components(state));

    SECTION("Parse errors skip the file") {
        auto result = pipeline.convert("CREATE TABLE t (x INT\nGO\nCREATE TABLE u (y INT\n", "bad.sql");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
        CHECK(result.error_message().starts_with("bad.sql: 2 parse error(s)\n  - line 1"));
    }

    SECTION("Files without a table are rejected") {
        auto result = pipeline.convert("CREATE SCHEMA [Sales]\n", "schema.sql");
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::TRANSFORM_ERROR);
        CHECK(result.error_message() == "schema.sql: no CREATE TABLE statement found");
    }

    SECTION("A pipeline needs a conversion state") {
        CHECK_THROWS_AS(ConversionPipeline(PipelineComponents{}), std::invalid_argument);
    }
}

TEST_CASE("EndToEnd: converting converted output is a fixed point", "[e2e][idempotence]") {

    MockConversionState state;
    const ConversionPipeline pipeline(components(state, true));

    const auto first = convert_ok(pipeline, R"(
CREATE TABLE [Sales].[Orders] (
    [OrderID] INT NOT NULL CONSTRAINT [DF_Orders_OrderID] DEFAULT (NEXT VALUE FOR [Sequences].[OrderID]),
    [CustomerID] INT NOT NULL,
    [Name] NVARCHAR(50) NULL,
    [Notes] NVARCHAR(MAX) NULL,
    [Amount] DECIMAL(18, 2) NULL DEFAULT ((0)),
    [IsActive] BIT NOT NULL DEFAULT ((1)),
    [RowGuid] UNIQUEIDENTIFIER NOT NULL DEFAULT (newid()),
    [LastEditedWhen] DATETIME2(7) NOT NULL DEFAULT (sysdatetime()),
    CONSTRAINT [PK_Sales_Orders] PRIMARY KEY CLUSTERED ([OrderID] ASC),
    CONSTRAINT [UQ_Sales_Orders_Name] UNIQUE ([Name]),
    CONSTRAINT [FK_Sales_Orders_CustomerID] FOREIGN KEY ([CustomerID])
        REFERENCES [Sales].[Customers] ([CustomerID]) ON DELETE CASCADE
)
GO
CREATE NONCLUSTERED INDEX [IX_Sales_Orders_CustomerID] ON [Sales].[Orders] ([CustomerID]) INCLUDE ([Amount])
GO
EXEC sys.sp_addextendedproperty @name = N'Description', @value = N'Orders placed by customers',
    @level0type = N'SCHEMA', @level0name = N'Sales', @level1type = N'TABLE', @level1name = N'Orders';
GO
EXEC sys.sp_addextendedproperty @name = N'Description', @value = N'It''s the key',
    @level0type = N'SCHEMA', @level0name = N'Sales', @level1type = N'TABLE', @level1name = N'Orders',
    @level2type = N'COLUMN', @level2name = N'OrderID';
GO
)");

    // Emitted DDL is valid PostgreSQL
    CHECK(std::ranges::none_of(first.report.diagnostics, [](const Diagnostic& d) {
        return d.kind == DiagnosticKind::OUTPUT_VALIDATION;
    }));

    const auto second = convert_ok(pipeline, first.ddl);
    CHECK(second.ddl == first.ddl);
    CHECK(second.primary_table == QualifiedName("sales", "orders"));

    // Nothing left to rewrite apart from re-confirming the comments
    for (const auto& rule : second.report.rules) {
        INFO(rule.code << ": " << rule.detail);
        CHECK((rule.category == RuleCategory::METADATA || rule.category == RuleCategory::IDENTIFIERS));
    }
}
