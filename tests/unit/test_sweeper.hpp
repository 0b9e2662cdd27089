#pragma once

namespace escrowcore::tests {

void test_sweeper_auto_release();
void test_sweeper_auto_refund();
void test_sweeper_retries_store_outage();
void test_sweeper_pending_expiry();
void test_sweeper_disputes_and_events();
void test_sweeper_thread_lifecycle();

}  // namespace escrowcore::tests
