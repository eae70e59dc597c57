#include <catch2/catch_test_macros.hpp>
#include "graph/dependency_extractor.hpp"
#include "graph/conversion_orchestrator.hpp"
#include "mocks/mock_conversion_state.hpp"

using namespace ddlbridge;
using ddlbridge::testing::MockConversionState;

namespace {

Constraint foreign_key(std::string column, QualifiedName target) {
    Constraint c;
    c.kind = ConstraintKind::FOREIGN_KEY;
    c.columns = {IndexColumn{std::move(column), ""}};
    c.ref_table = std::move(target);
    c.ref_columns = {"Id"};
    return c;
}

StatementNode table(QualifiedName name, std::vector<Constraint> constraints) {
    TableNode t;
    t.name = std::move(name);
    t.constraints = std::move(constraints);
    return StatementNode(std::move(t));
}

DependencyEdge edge(std::string_view from, std::string_view to, std::vector<std::string> columns) {
    return DependencyEdge{ObjectKey::from("sales", from), ObjectKey::from("sales", to),
                          std::move(columns)};
}

} // namespace

TEST_CASE("DependencyExtractor: foreign keys become edges", "[dependency]") {

    SECTION("References to one target are merged") {
        std::vector<StatementNode> nodes{
            table({"Sales", "Orders"}, {
                foreign_key("CustomerID", {"Sales", "Customers"}),
                foreign_key("BillToCustomerID", {"sales", "customers"}),
                foreign_key("customerid", {"Sales", "Customers"}),
                foreign_key("SalespersonID", {"Application", "People"}),
            }),
        };

        auto edges = DependencyExtractor::extract(nodes);
        REQUIRE(edges.size() == 2);
        CHECK(edges[0].from == ObjectKey::from("sales", "orders"));
        CHECK(edges[0].to == ObjectKey::from("sales", "customers"));
        CHECK(edges[0].columns == std::vector<std::string>{"CustomerID", "BillToCustomerID"});
        CHECK(edges[1].to == ObjectKey::from("application", "people"));
    }

    SECTION("Self-references are kept as edges") {
        std::vector<StatementNode> nodes{
            table({"", "People"}, {foreign_key("ManagerID", {"dbo", "People"})}),
        };
        auto edges = DependencyExtractor::extract(nodes);
        REQUIRE(edges.size() == 1);
        CHECK(edges[0].is_self_reference());
        CHECK(edges[0].from.to_string() == "dbo.people");
    }

    SECTION("Non-table nodes are ignored") {
        std::vector<StatementNode> nodes{StatementNode(SchemaNode{"sales"}),
                                         StatementNode(RawNode{})};
        CHECK(DependencyExtractor::extract(nodes).empty());
    }
}

TEST_CASE("ConversionOrchestrator: unresolved dependencies", "[dependency][orchestrator]") {

    SECTION("Targets with output are resolved") {
        MockConversionState state{ObjectKey::from("sales", "b")};
        ConversionOrchestrator orchestrator(state);

        auto groups = orchestrator.unresolved({edge("a", "b", {"BID"}), edge("a", "c", {"CID"})});
        REQUIRE(groups.size() == 1);
        CHECK(groups[0].target == ObjectKey::from("sales", "c"));
        CHECK(groups[0].columns == std::vector<std::string>{"CID"});
        CHECK(groups[0].referenced_by == std::vector<ObjectKey>{ObjectKey::from("sales", "a")});
        CHECK(groups[0].in_input_tree);
    }

    SECTION("Nothing is unresolved once every target has output") {
        MockConversionState state{ObjectKey::from("sales", "b"), ObjectKey::from("sales", "c")};
        ConversionOrchestrator orchestrator(state);
        CHECK(orchestrator.unresolved({edge("a", "b", {"BID"}), edge("a", "c", {"CID"})}).empty());
    }

    SECTION("Self-references never appear") {
        MockConversionState state;
        ConversionOrchestrator orchestrator(state);
        CHECK(orchestrator.unresolved({edge("a", "a", {"ParentID"})}).empty());
    }

    SECTION("Groups merge owners and columns, sorted by target") {
        MockConversionState state;
        ConversionOrchestrator orchestrator(state);

        auto groups = orchestrator.unresolved({
            edge("orders", "people", {"SalespersonID"}),
            edge("orders", "customers", {"CustomerID"}),
            edge("invoices", "customers", {"CustomerID", "BillToID"}),
        });
        REQUIRE(groups.size() == 2);
        CHECK(groups[0].target.table == "customers");
        CHECK(groups[0].columns == std::vector<std::string>{"CustomerID", "BillToID"});
        CHECK(groups[0].referenced_by == std::vector<ObjectKey>{
            ObjectKey::from("sales", "orders"), ObjectKey::from("sales", "invoices")});
        CHECK(groups[1].target.table == "people");
    }

    SECTION("Targets missing from the input tree are marked") {
        MockConversionState state;
        ConversionOrchestrator orchestrator(state, [](const ObjectKey& key) {
            return key.table == "customers";
        });

        auto groups = orchestrator.unresolved({
            edge("orders", "customers", {"CustomerID"}),
            edge("orders", "ghosts", {"GhostID"}),
        });
        REQUIRE(groups.size() == 2);
        CHECK(groups[0].in_input_tree);
        CHECK_FALSE(groups[1].in_input_tree);
    }

    SECTION("Conversion state is consulted per edge") {
        MockConversionState state;
        ConversionOrchestrator orchestrator(state);
        (void)orchestrator.unresolved({edge("a", "b", {"x"}), edge("a", "c", {"y"})});
        CHECK(state.query_count() == 2);
    }
}

TEST_CASE("ConversionOrchestrator: cycle notes", "[dependency][orchestrator]") {

    SECTION("Self-reference") {
        auto notes = ConversionOrchestrator::cycle_notes({edge("people", "people", {"ManagerID"})});
        REQUIRE(notes.size() == 1);
        CHECK(notes[0].kind == DiagnosticKind::DEPENDENCY_CYCLE);
        CHECK(notes[0].message == "sales.people references itself (ManagerID)");
    }

    SECTION("Mutual references are reported once") {
        auto notes = ConversionOrchestrator::cycle_notes({
            edge("a", "b", {"BID"}),
            edge("b", "a", {"AID"}),
        });
        REQUIRE(notes.size() == 1);
        CHECK(notes[0].message == "sales.a and sales.b reference each other");
    }

    SECTION("Acyclic edges produce nothing") {
        CHECK(ConversionOrchestrator::cycle_notes({edge("a", "b", {"BID"})}).empty());
    }
}
