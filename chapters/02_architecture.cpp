#include "chapters.h"
#include "folio/primitives.h"

namespace folio {
namespace chapters {

static const char* WORKSPACE_LAYOUT =
    "momentum-sez/stack/\n"
    "├── Cargo.toml              # Workspace root\n"
    "├── msez-core/              # Foundation (zero internal deps)\n"
    "├── msez-crypto/            # Cryptographic primitives\n"
    "├── msez-tensor/            # Compliance Tensor V2\n"
    "├── msez-pack/              # Pack Trilogy\n"
    "├── msez-corridor/          # Trade Corridors\n"
    "├── msez-api/               # Axum HTTP Server\n"
    "└── msez-cli/               # Command-Line Interface";

ChapterOutput build_architecture(const StyleConstants&) {
    return {
        chapter_heading("Chapter 2: Architecture Overview"),

        p("The SEZ Stack is organized as a layered architecture where each layer has a "
          "well-defined responsibility and interacts only with adjacent layers."),

        h2("2.1 Layer Model"),

        table({"Layer", "Name", "Function", "Implementation"},
              {
                  {"L0", "Infrastructure", "Compute, storage, networking, HSMs", "AWS/GCP/bare metal, Terraform"},
                  {"L1", "Settlement", "Cryptographic finality, state roots, ZK proofs", "Mass Protocol (Plonky3)"},
                  {"L2", "Primitives", "Entity, ownership, fiscal, identity, consent", "Mass APIs"},
                  {"L3", "Jurisdiction", "Compliance tensor, pack trilogy, corridors, credentials", "MSEZ Stack"},
                  {"L4", "Orchestration", "Workflow composition, agentic triggers, sagas", "MSEZ Stack"},
                  {"L5", "Application", "GovOS console, developer APIs, dashboards", "Web applications"},
              },
              {800, 2000, 3760, 2800}),

        p_runs({
            "Layers L0 to L2 are provided by Mass. Layers L3 and L4 are the ",
            bold("MSEZ Stack"),
            ". Layer L5 is built by deployment teams using the Stack APIs.",
        }),

        h2("2.2 Module Architecture"),

        p("The MSEZ Stack is organized into module families, each addressing a distinct domain of "
          "SEZ governance. No family directly accesses another family's internal state."),

        h3("2.2.1 Crate Map"),

        table({"Crate", "Lines", "Purpose"},
              {
                  {"msez-core", "~3,200", "Canonical digest, ComplianceDomain, identifier newtypes, error hierarchy"},
                  {"msez-crypto", "~2,800", "Ed25519 signing and verification, MMR, CAS"},
                  {"msez-tensor", "~4,100", "Compliance Tensor V2 and the Compliance Manifold"},
                  {"msez-corridor", "~3,600", "Receipt chains, fork resolution, netting"},
                  {"msez-api", "~4,800", "Axum routes and Postgres persistence"},
              },
              {3000, 1200, 5160}),

        h3("2.2.2 Rust Workspace Structure"),

        p_runs({
            "The dependency graph is acyclic, with ",
            code("msez-core"),
            " at the root and ",
            code("msez-api"),
            " as the composition point.",
        }),

        code_block(WORKSPACE_LAYOUT),

        h2("2.3 Live Deployments"),

        p("The architecture is validated by production deployments across multiple jurisdictions."),

        bullet_item("Pakistan GovOS: 40+ ministries with FBR tax integration."),
        bullet_item("UAE / ADGM: 1,000+ entities onboarded."),
        bullet_runs({bold("PAK ↔ UAE corridor: "), "SWIFT pacs.008 adapter for cross-border payments."}),
    };
}

}  // namespace chapters
}  // namespace folio
