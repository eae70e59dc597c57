#include <catch2/catch_test_macros.hpp>
#include "parser/ddl_parser.hpp"

using namespace ddlbridge;

namespace {

const TableNode& only_table(const ParseOutput& out) {
    REQUIRE(out.ok());
    REQUIRE(out.nodes.size() == 1);
    const auto* table = out.nodes[0].as<TableNode>();
    REQUIRE(table != nullptr);
    return *table;
}

} // namespace

TEST_CASE("DdlParser: CREATE TABLE columns", "[parser]") {

    DdlParser parser;

    SECTION("Bracketed names, types, nullability and defaults") {
        auto out = parser.parse(R"(
CREATE TABLE [Sales].[Orders] (
    [OrderID] INT NOT NULL CONSTRAINT [DF_Orders_OrderID] DEFAULT (NEXT VALUE FOR [Sequences].[OrderID]),
    [Amount] DECIMAL(18, 2) NULL DEFAULT ((0)),
    [Note] NVARCHAR(MAX) NULL,
    [IsActive] BIT NOT NULL DEFAULT ((1)),
    [CreatedAt] DATETIME2(7) NOT NULL DEFAULT (sysdatetime())
)
GO
)");
        const auto& table = only_table(out);
        CHECK(table.name.schema == "Sales");
        CHECK(table.name.name == "Orders");
        REQUIRE(table.columns.size() == 5);

        const auto& id = table.columns[0];
        CHECK(id.name == "OrderID");
        CHECK(id.type.name == "INT");
        CHECK(id.nullable == std::optional<bool>(false));
        REQUIRE(id.default_value);
        CHECK(id.default_value->kind == DefaultKind::SEQUENCE_NEXT);
        CHECK(id.default_value->sequence == QualifiedName("Sequences", "OrderID"));
        CHECK(id.default_value->constraint_name == "DF_Orders_OrderID");

        const auto& amount = table.columns[1];
        CHECK(amount.type.args == std::vector<std::string>{"18", "2"});
        REQUIRE(amount.default_value);
        CHECK(amount.default_value->kind == DefaultKind::NUMBER);
        CHECK(amount.default_value->value == "0");
        CHECK(amount.ordinal == 1);

        CHECK(table.columns[2].type.args == std::vector<std::string>{"MAX"});
        CHECK(table.columns[4].default_value->kind == DefaultKind::CURRENT_TIMESTAMP);
    }

    SECTION("DEFAULT NULL and string defaults") {
        auto out = parser.parse(
            "CREATE TABLE t (a INT DEFAULT NULL, b NVARCHAR(10) DEFAULT N'it''s' NOT NULL)");
        const auto& table = only_table(out);
        REQUIRE(table.columns.size() == 2);
        CHECK(table.columns[0].default_value->kind == DefaultKind::NULL_VALUE);
        CHECK(table.columns[1].default_value->kind == DefaultKind::STRING);
        CHECK(table.columns[1].default_value->value == "it's");
        CHECK(table.columns[1].nullable == std::optional<bool>(false));
    }

    SECTION("IDENTITY and UTC / UUID defaults") {
        auto out = parser.parse(
            "CREATE TABLE dbo.T (Id INT IDENTITY(100, 5) NOT NULL, "
            "G UNIQUEIDENTIFIER DEFAULT newid(), U DATETIME2 DEFAULT (getutcdate()))");
        const auto& table = only_table(out);
        REQUIRE(table.columns[0].identity);
        CHECK(table.columns[0].identity->seed == "100");
        CHECK(table.columns[0].identity->increment == "5");
        CHECK(table.columns[1].default_value->kind == DefaultKind::UUID_GENERATE);
        CHECK(table.columns[2].default_value->kind == DefaultKind::UTC_TIMESTAMP);
    }

    SECTION("Computed columns are kept as raw elements") {
        auto out = parser.parse("CREATE TABLE t (a INT, b AS (a * 2), c INT)");
        const auto& table = only_table(out);
        REQUIRE(table.columns.size() == 2);
        CHECK(table.columns[1].name == "c");
        CHECK(table.columns[1].ordinal == 1);
        REQUIRE(table.raw_elements.size() == 1);
        CHECK(table.raw_elements[0].text == "b AS (a * 2)");
        CHECK(table.raw_elements[0].reason == "computed column");
    }
}

TEST_CASE("DdlParser: table constraints", "[parser]") {

    DdlParser parser;

    SECTION("Named PK, FK and CHECK") {
        auto out = parser.parse(R"(
CREATE TABLE [Sales].[Orders] (
    [OrderID] INT NOT NULL,
    [CustomerID] INT NOT NULL,
    CONSTRAINT [PK_Sales_Orders] PRIMARY KEY CLUSTERED ([OrderID] ASC),
    CONSTRAINT [FK_Orders_Customers] FOREIGN KEY ([CustomerID])
        REFERENCES [Sales].[Customers] ([CustomerID]) ON DELETE CASCADE,
    CONSTRAINT [CK_Orders_Id] CHECK ([OrderID] > 0)
))");
        const auto& table = only_table(out);
        REQUIRE(table.constraints.size() == 3);

        const auto& pk = table.constraints[0];
        CHECK(pk.kind == ConstraintKind::PRIMARY_KEY);
        CHECK(pk.name == "PK_Sales_Orders");
        CHECK(pk.clustering == "CLUSTERED");
        REQUIRE(pk.columns.size() == 1);
        CHECK(pk.columns[0].name == "OrderID");
        CHECK(pk.columns[0].direction == "ASC");

        const auto& fk = table.constraints[1];
        CHECK(fk.kind == ConstraintKind::FOREIGN_KEY);
        CHECK(fk.ref_table == QualifiedName("Sales", "Customers"));
        CHECK(fk.ref_columns == std::vector<std::string>{"CustomerID"});
        CHECK(fk.on_delete == "CASCADE");

        const auto& ck = table.constraints[2];
        CHECK(ck.kind == ConstraintKind::CHECK);
        CHECK(ck.check_expression == "[OrderID] > 0");
    }

    SECTION("Inline column constraints are lifted") {
        auto out = parser.parse(
            "CREATE TABLE t (id INT PRIMARY KEY, parent INT REFERENCES t (id), "
            "code CHAR(3) UNIQUE)");
        const auto& table = only_table(out);
        REQUIRE(table.constraints.size() == 3);
        CHECK(table.constraints[0].kind == ConstraintKind::PRIMARY_KEY);
        CHECK(table.constraints[0].columns[0].name == "id");
        CHECK(table.constraints[1].kind == ConstraintKind::FOREIGN_KEY);
        CHECK(table.constraints[1].columns[0].name == "parent");
        CHECK(table.constraints[1].ref_table == QualifiedName("", "t"));
        CHECK(table.constraints[2].kind == ConstraintKind::UNIQUE);
    }

    SECTION("Constraint index options are recorded") {
        auto out = parser.parse(
            "CREATE TABLE t (id INT, CONSTRAINT PK_t PRIMARY KEY (id) "
            "WITH (FILLFACTOR = 90) ON [PRIMARY])");
        const auto& table = only_table(out);
        REQUIRE(table.options.size() == 2);
        CHECK(table.options[0].name == "CONSTRAINT PK_t");
        CHECK(table.options[0].text == "WITH (FILLFACTOR = 90)");
        CHECK(table.options[1].text == "ON [PRIMARY]");
    }
}

TEST_CASE("DdlParser: temporal and storage clauses", "[parser][temporal]") {

    DdlParser parser;

    auto out = parser.parse(R"(
CREATE TABLE [Warehouse].[Colors] (
    [ColorID] INT NOT NULL,
    [ValidFrom] DATETIME2(7) GENERATED ALWAYS AS ROW START NOT NULL,
    [ValidTo] DATETIME2(7) GENERATED ALWAYS AS ROW END NOT NULL,
    PERIOD FOR SYSTEM_TIME ([ValidFrom], [ValidTo])
) ON [USERDATA] TEXTIMAGE_ON [USERDATA]
WITH (SYSTEM_VERSIONING = ON (HISTORY_TABLE = [Warehouse].[Colors_Archive]), DATA_COMPRESSION = PAGE)
)");
    const auto& table = only_table(out);
    REQUIRE(table.period);
    CHECK(table.period->start_column == "ValidFrom");
    CHECK(table.period->end_column == "ValidTo");
    CHECK(table.system_versioning);
    REQUIRE(table.history_table);
    CHECK(*table.history_table == QualifiedName("Warehouse", "Colors_Archive"));
    CHECK(table.columns[1].generated == GeneratedKind::ROW_START);
    CHECK(table.columns[2].generated == GeneratedKind::ROW_END);
    CHECK(table.storage_clause == "ON [USERDATA] TEXTIMAGE_ON [USERDATA]");
    REQUIRE(table.options.size() == 1);
    CHECK(table.options[0].name == "DATA_COMPRESSION");
}

TEST_CASE("DdlParser: other statements", "[parser]") {

    DdlParser parser;

    SECTION("CREATE SEQUENCE options") {
        auto out = parser.parse(
            "CREATE SEQUENCE [Sequences].[OrderID] AS INT START WITH 1000 INCREMENT BY 1 "
            "MINVALUE 1 NO MAXVALUE CACHE 20");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 1);
        const auto* seq = out.nodes[0].as<SequenceNode>();
        REQUIRE(seq != nullptr);
        CHECK(seq->name == QualifiedName("Sequences", "OrderID"));
        CHECK(seq->type->name == "INT");
        CHECK(seq->start == std::optional<std::string>("1000"));
        CHECK(seq->min_value == std::optional<std::string>("1"));
        CHECK_FALSE(seq->max_value);
        CHECK(seq->cache == std::optional<std::string>("20"));
    }

    SECTION("Indexes") {
        auto out = parser.parse(
            "CREATE NONCLUSTERED INDEX [IX_Orders_Customer] ON [Sales].[Orders] "
            "([CustomerID] ASC, [OrderDate] DESC) INCLUDE ([Amount]) WHERE [Amount] > 0 "
            "WITH (ONLINE = ON) ON [USERDATA];\n"
            "CREATE NONCLUSTERED COLUMNSTORE INDEX [NCCX_Orders] ON [Sales].[Orders] ([OrderID]);");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 2);
        const auto* ix = out.nodes[0].as<IndexNode>();
        REQUIRE(ix != nullptr);
        CHECK(ix->clustering == "NONCLUSTERED");
        REQUIRE(ix->columns.size() == 2);
        CHECK(ix->columns[1].direction == "DESC");
        CHECK(ix->include_columns == std::vector<std::string>{"Amount"});
        CHECK(ix->where_clause == "[Amount] > 0");
        CHECK(ix->with_options == "WITH (ONLINE = ON)");
        CHECK(ix->storage_clause == "ON [USERDATA]");

        const auto* cs = out.nodes[1].as<IndexNode>();
        REQUIRE(cs != nullptr);
        CHECK(cs->columnstore);
    }

    SECTION("Extended properties by level") {
        auto out = parser.parse(R"(
EXEC sys.sp_addextendedproperty @name = N'Description', @value = N'Orders placed',
    @level0type = N'SCHEMA', @level0name = N'Sales', @level1type = N'TABLE', @level1name = N'Orders';
EXEC sp_addextendedproperty N'Description', N'Order key', N'SCHEMA', N'Sales',
    N'TABLE', N'Orders', N'COLUMN', N'OrderID';
EXEC sp_addextendedproperty @name = N'Description', @value = N'Lookup index',
    @level0type = N'SCHEMA', @level0name = N'Sales', @level1type = N'TABLE', @level1name = N'Orders',
    @level2type = N'INDEX', @level2name = N'IX_Orders_Customer';
EXEC sp_addextendedproperty @name = N'Description', @value = N'Sales schema',
    @level0type = N'SCHEMA', @level0name = N'Sales';
)");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 4);
        const auto* table = out.nodes[0].as<ExtendedPropertyNode>();
        const auto* column = out.nodes[1].as<ExtendedPropertyNode>();
        const auto* index = out.nodes[2].as<ExtendedPropertyNode>();
        const auto* schema = out.nodes[3].as<ExtendedPropertyNode>();
        REQUIRE(table);
        REQUIRE(column);
        REQUIRE(index);
        REQUIRE(schema);
        CHECK(table->level == MetadataLevel::TABLE);
        CHECK(table->value == std::optional<std::string>("Orders placed"));
        CHECK(column->level == MetadataLevel::COLUMN);
        CHECK(column->sub_name == "OrderID");
        CHECK(index->level == MetadataLevel::INDEX);
        CHECK(schema->level == MetadataLevel::SCHEMA);
    }

    SECTION("Unrecognized statements pass through verbatim") {
        const std::string text = "ALTER TABLE [dbo].[T] ADD [x] INT";
        auto out = parser.parse(text);
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 1);
        const auto* raw = out.nodes[0].as<RawNode>();
        REQUIRE(raw != nullptr);
        CHECK(raw->kind == RawKind::UNRECOGNIZED);
        CHECK(raw->text == text);
    }

    SECTION("SET options and a table in one batch split at CREATE") {
        auto out = parser.parse("SET ANSI_NULLS ON\nGO\nCREATE SCHEMA [Sales] AUTHORIZATION [dbo]");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 2);
        CHECK(out.nodes[0].is<RawNode>());
        REQUIRE(out.nodes[1].is<SchemaNode>());
        CHECK(out.nodes[1].as<SchemaNode>()->name == "Sales");
    }
}

TEST_CASE("DdlParser: parse errors are statement-scoped", "[parser][errors]") {

    DdlParser parser;

    SECTION("Unbalanced parenthesis reports position, later statements still parse") {
        auto out = parser.parse("CREATE TABLE a (x INT\nGO\nCREATE TABLE b (y INT)\nGO\n");
        REQUIRE(out.errors.size() == 1);
        CHECK(out.errors[0].line == 1);
        CHECK(out.errors[0].column == 16);
        CHECK(out.errors[0].reason.find("unbalanced") != std::string::npos);
        CHECK(out.errors[0].statement_text == "CREATE TABLE a (x INT");
        REQUIRE(out.nodes.size() == 1);
        CHECK(out.nodes[0].as<TableNode>()->name.name == "b");
    }

    SECTION("Unterminated string literal") {
        auto out = parser.parse("CREATE TABLE t (x NVARCHAR(5) DEFAULT N'abc)");
        REQUIRE(out.errors.size() == 1);
        CHECK(out.errors[0].reason == "unterminated string literal");
        CHECK(out.nodes.empty());
    }

    SECTION("Stray closing bracket") {
        auto out = parser.parse("CREATE TABLE t (x INT])");
        REQUIRE(out.errors.size() == 1);
        CHECK(out.errors[0].to_string().starts_with("line 1, column 22:"));
    }
}

TEST_CASE("DdlParser: PostgreSQL output re-parses", "[parser]") {

    DdlParser parser;

    auto out = parser.parse(R"(CREATE SCHEMA IF NOT EXISTS sales;

CREATE SEQUENCE IF NOT EXISTS sequences.order_id_seq START 1 INCREMENT 1;

CREATE TABLE sales.orders (
    OrderID    INTEGER        DEFAULT nextval('sequences.order_id_seq') NOT NULL,
    Placed     TIMESTAMP(6)   DEFAULT (CURRENT_TIMESTAMP AT TIME ZONE 'UTC')
);

COMMENT ON COLUMN sales.orders.OrderID IS 'Order key';
)");
    REQUIRE(out.ok());
    REQUIRE(out.nodes.size() == 4);
    CHECK(out.nodes[0].is<SchemaNode>());
    CHECK(out.nodes[1].as<SequenceNode>()->start == std::optional<std::string>("1"));
    const auto* table = out.nodes[2].as<TableNode>();
    REQUIRE(table != nullptr);
    CHECK(table->columns[0].default_value->kind == DefaultKind::SEQUENCE_NEXT);
    CHECK(table->columns[0].default_value->sequence == QualifiedName("sequences", "order_id_seq"));
    CHECK(table->columns[1].default_value->kind == DefaultKind::UTC_TIMESTAMP);
    const auto* comment = out.nodes[3].as<ExtendedPropertyNode>();
    REQUIRE(comment != nullptr);
    CHECK(comment->level == MetadataLevel::COLUMN);
    CHECK(comment->schema == "sales");
    CHECK(comment->sub_name == "OrderID");
}

TEST_CASE("DdlParser: comments are kept", "[parser][comments]") {

    DdlParser parser;

    auto comment_at = [](const ParseOutput& out, size_t i) -> std::string {
        const auto* raw = out.nodes.at(i).as<RawNode>();
        if (raw == nullptr || raw->kind != RawKind::COMMENT) return "<not a comment>";
        return raw->text;
    };

    SECTION("Comment after a table in the same batch") {
        auto out = parser.parse("CREATE TABLE [dbo].[X] ([a] INT)\n-- audit note\nGO\n");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 2);
        CHECK(out.nodes[0].is<TableNode>());
        CHECK(comment_at(out, 1) == "-- audit note");
    }

    SECTION("Leading comments become their own node") {
        auto out = parser.parse("-- Orders\n/* owned by sales */\nCREATE TABLE [dbo].[X] ([a] INT)");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 2);
        CHECK(comment_at(out, 0) == "-- Orders\n/* owned by sales */");
        CHECK(out.nodes[1].is<TableNode>());
    }

    SECTION("Comments inside a table body follow the table") {
        auto out = parser.parse(R"(CREATE TABLE [dbo].[X] (
    [a] INT, -- key
    -- legacy column
    [b] INT
))");
        REQUIRE(out.ok());
        REQUIRE(out.nodes.size() == 2);
        const auto* table = out.nodes[0].as<TableNode>();
        REQUIRE(table != nullptr);
        CHECK(table->columns.size() == 2);
        CHECK(comment_at(out, 1) == "-- key\n-- legacy column");
    }

    SECTION("Unrecognized statements keep inner comments in their text") {
        auto out = parser.parse("ALTER TABLE [dbo].[T] /* widen */ ADD [x] INT");
        REQUIRE(out.nodes.size() == 1);
        const auto* raw = out.nodes[0].as<RawNode>();
        REQUIRE(raw != nullptr);
        CHECK(raw->text == "ALTER TABLE [dbo].[T] /* widen */ ADD [x] INT");
    }
}
