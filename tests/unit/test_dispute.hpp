#pragma once

namespace escrowcore::tests {

void test_dispute_split_resolution();
void test_dispute_split_failure_moves_nothing();
void test_dispute_resume_after_settlement();
void test_dispute_buyer_resolution();
void test_dispute_seller_resolution();
void test_dispute_rules();
void test_dispute_escalation();

}  // namespace escrowcore::tests
