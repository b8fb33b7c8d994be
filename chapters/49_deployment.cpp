#include "chapters.h"
#include "folio/primitives.h"

namespace folio {
namespace chapters {

static const char* RELEASE_BUILD =
    "# Build the release binary\n"
    "cargo build --release --bin msez\n"
    "\n"
    "# Deploy directly or via container:\n"
    "FROM alpine:3.19\n"
    "COPY target/release/msez /usr/local/bin/msez\n"
    "ENTRYPOINT [\"/usr/local/bin/msez\"]";

ChapterOutput build_deployment(const StyleConstants&) {
    return {
        part_heading("PART XVII: DEPLOYMENT AND OPERATIONS"),

        chapter_heading("Chapter 49: Deployment Architecture"),

        h2("49.1 Infrastructure Requirements"),
        table({"Component", "Minimum", "Recommended"},
              {
                  {"Compute", "4 vCPU, 16 GB RAM", "8 vCPU, 32 GB RAM"},
                  {"Storage", "100 GB SSD", "500 GB NVMe SSD"},
                  {"Network", "100 Mbps", "1 Gbps"},
                  {"Database", "PostgreSQL 15+", "PostgreSQL 16 with pgvector"},
                  {"Container Runtime", "Docker 24+", "containerd 1.7+ with Kubernetes 1.29+"},
              },
              {2000, 3200, 4160}),

        h2("49.2 Deployment Profiles"),
        table({"Profile", "Services", "Resources", "Use Case"},
              {
                  {"minimal", "Core MSEZ + single jurisdiction", "4 vCPU / 16 GB", "Development, testing"},
                  {"standard", "Full MSEZ + 3 jurisdictions + corridors", "8 vCPU / 32 GB", "Single-zone production"},
                  {"enterprise", "Full MSEZ + 10+ jurisdictions", "32 vCPU / 128 GB", "Multi-zone production"},
                  {"sovereign-govos", "Full MSEZ + GovOS + national integration", "64+ vCPU / 256+ GB", "National deployment"},
              },
              {1600, 3000, 2200, 2560}),

        h3("49.2.1 Rust Binary Deployment"),
        p("The msez CLI is a single statically-linked binary. Container images use Alpine Linux "
          "with the msez binary, producing images under 50 MB."),
        code_block(RELEASE_BUILD),

        h2("49.3 Resource Scaling Guidelines"),
        p("Resource allocation scales with three primary drivers:"),
        bullet_item("Jurisdictional breadth: number of active jurisdictions and their regulatory complexity"),
        bullet_item("Corridor throughput: transactions per second across all active corridors"),
        bullet_item("Credential volume: VCs issued and verified per day"),
        p_runs({
            bold("Vertical vs. Horizontal. "),
            "The msez-api and msez-worker services scale horizontally. PostgreSQL scales "
            "vertically first and then through read replicas.",
        }),
        rule_light(),
    };
}

}  // namespace chapters
}  // namespace folio
