#include <catch2/catch_test_macros.hpp>
#include "emit/output_validator.hpp"

using namespace ddlbridge;

TEST_CASE("OutputValidator: emitted DDL parses", "[validator]") {

    SECTION("Schemas, sequences, tables, indexes and comments") {
        auto result = OutputValidator::validate(
            "CREATE SCHEMA IF NOT EXISTS sales;\n"
            "\n"
            "CREATE SEQUENCE IF NOT EXISTS sequences.order_id_seq AS INTEGER START 1000 INCREMENT 1 CACHE 20;\n"
            "\n"
            "CREATE TABLE sales.orders (\n"
            "    OrderID    INTEGER        DEFAULT nextval('sequences.order_id_seq') NOT NULL,\n"
            "    Id         INTEGER        GENERATED BY DEFAULT AS IDENTITY (START WITH 1 INCREMENT BY 1) NOT NULL,\n"
            "    Placed     TIMESTAMP(6)   DEFAULT (CURRENT_TIMESTAMP AT TIME ZONE 'UTC') NOT NULL,\n"
            "    Location   geography,\n"
            "    \"Unit Price\" NUMERIC(18,2) NULL,\n"
            "    CONSTRAINT PK_Orders PRIMARY KEY (OrderID),\n"
            "    CONSTRAINT FK_Orders_Customers FOREIGN KEY (CustomerID) REFERENCES sales.customers (CustomerID),\n"
            "    CONSTRAINT CK_Qty CHECK (OrderID > (0))\n"
            ");\n"
            "\n"
            "CREATE INDEX IX_Orders_Placed\n"
            "    ON sales.orders (Placed DESC) INCLUDE (OrderID) WHERE OrderID > 0;\n"
            "\n"
            "-- Storage clause omitted (PostgreSQL has no filegroups): ON [USERDATA]\n"
            "\n"
            "COMMENT ON TABLE sales.orders IS 'Orders placed';\n"
            "COMMENT ON COLUMN sales.orders.OrderID IS 'It''s the key';\n");
        CHECK(result.is_ok());
    }

    SECTION("Comment-only and empty scripts") {
        CHECK(OutputValidator::validate("-- nothing to do\n").is_ok());
        CHECK(OutputValidator::validate("").is_ok());
    }
}

TEST_CASE("OutputValidator: syntax errors are reported with a line", "[validator]") {

    auto result = OutputValidator::validate(
        "CREATE TABLE t (\n"
        "    a INTEGER,\n"
        "    b INTEGER NOT NOT NULL\n"
        ");\n");

    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::VALIDATION_ERROR);
    CHECK(result.error_message().starts_with("line 3: "));
}

TEST_CASE("OutputValidator: T-SQL is rejected", "[validator]") {

    auto result = OutputValidator::validate("CREATE TABLE [dbo].[T] ([x] INT)");
    REQUIRE(result.is_error());
    CHECK(result.error_message().starts_with("line 1: "));
}
