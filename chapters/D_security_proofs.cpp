#include "chapters.h"
#include "folio/primitives.h"

namespace folio {
namespace chapters {

ChapterOutput build_appendix_security_proofs(const StyleConstants&) {
    return {
        chapter_heading("Appendix D: Security Proofs Summary"),

        h2("D.1 Theorem Index"),
        table({"Theorem", "Statement"},
              {
                  {"9.1 (Object Survivability)", "Receipt chains maintain integrity during offline operation"},
                  {"10.1 (Compliance Soundness)", "False compliance claims are computationally infeasible"},
                  {"28.1 (Watcher Accountability)", "Dishonest attestations result in provable collateral loss"},
                  {"32.1 (Double-Spend Resistance)", "Each record can be spent exactly once via nullifier mechanism"},
              },
              {2800, 6560}),

        h2("D.2 Formal Definitions"),

        definition("Definition D.1 (Receipt Chain).",
                   "A receipt chain C is an ordered sequence of receipts (r_0, r_1, ..., r_n) where "
                   "r_0 is the genesis receipt and each r_i (i > 0) contains a payload hash, the digest "
                   "of the previous receipt H(r_{i-1}), and an MMR root over all receipts up to r_i."),

        definition("Definition D.5 (Nullifier).",
                   "For a record r with secret key sk, the nullifier is nf = H(sk || r.id) where H is "
                   "SHA-256. Publishing nf marks r as spent. The nullifier set is append-only."),

        h2("D.3 Proof Sketches"),

        h3("D.3.1 Theorem 9.1: Object Survivability"),
        theorem("Theorem 9.1.",
                "Let A be a Smart Asset with receipt chain C = (r_0, ..., r_n). If A operates offline, "
                "appending receipts locally, then upon reconnection the offline receipts can be "
                "verified and merged without loss of integrity."),
        p_runs({bold("Proof sketch. "), "The proof proceeds in three steps."}),
        p("Each offline receipt carries the back-link to its predecessor, so any tampering breaks "
          "the chain. On reconnection the verifier walks the offline chain from the last known "
          "online receipt. A conflicting fork is detected because two receipts share a back-link "
          "but differ in digest. QED."),

        h3("D.3.2 Theorem 32.1: Double-Spend Resistance"),
        theorem("Theorem 32.1.",
                "Each record can be spent at most once."),
        p_runs({
            bold("Proof sketch. "),
            "A second spend publishes the same nullifier, which is already in the set. ",
            italic("QED."),
        }),
    };
}

}  // namespace chapters
}  // namespace folio
