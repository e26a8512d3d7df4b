// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "branch/format.hpp"
#include "branch/messages.hpp"
#include "util/serialization/util.hpp"

#include <gtest/gtest.h>

class serialization_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_account.m_account_no = 1001;
        m_account.m_name = "User_mumbai_1001";
        m_account.m_balance = 1000;
        m_account.m_reserved = 250;
        m_account.m_version = 7;
        m_account.m_reserved_by = "mumbai-1-0-ab";

        m_record.m_tx_id = "mumbai-1-0-ab";
        m_record.m_src_account = 1001;
        m_record.m_dst_endpoint = {"127.0.0.1", 5602};
        m_record.m_dst_account = 1002;
        m_record.m_amount = 250;
        m_record.m_phase = branchnet::coordinator::tx_phase::committing;
        m_record.m_unresolved = true;
        m_record.m_reason = branchnet::error{
            branchnet::error_code::peer_unreachable,
            "delhi down"};
        m_record.m_created = 1234;
        m_record.m_deliver_src = true;
        m_record.m_deliver_dst = false;
    }

    branchnet::ledger::account m_account;
    branchnet::coordinator::record m_record;
};

TEST_F(serialization_test, account_with_reservation) {
    auto buf = branchnet::make_buffer(m_account);
    auto acc = branchnet::from_buffer<branchnet::ledger::account>(buf);
    ASSERT_TRUE(acc.has_value());
    ASSERT_EQ(acc.value(), m_account);

    m_account.m_reserved = 0;
    m_account.m_reserved_by.reset();
    buf = branchnet::make_buffer(m_account);
    acc = branchnet::from_buffer<branchnet::ledger::account>(buf);
    ASSERT_TRUE(acc.has_value());
    ASSERT_FALSE(acc->m_reserved_by.has_value());
}

TEST_F(serialization_test, prepare_request) {
    auto params = branchnet::participant::prepare_params{
        "mumbai-1-0-ab",
        branchnet::participant::side::credit,
        1002,
        250};
    auto req = branchnet::branch::request{
        branchnet::branch::prepare_request{params}};
    auto buf = branchnet::make_buffer(req);
    auto out = branchnet::from_buffer<branchnet::branch::request>(buf);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(
        std::holds_alternative<branchnet::branch::prepare_request>(*out));
    ASSERT_EQ(std::get<branchnet::branch::prepare_request>(*out).m_params,
              params);
}

TEST_F(serialization_test, transfer_request_optional_tx_id) {
    auto msg = branchnet::branch::inter_branch_transfer_request{};
    msg.m_src_account = 1001;
    msg.m_dst_endpoint = {"127.0.0.1", 5602};
    msg.m_dst_account = 1002;
    msg.m_amount = 300;

    auto buf = branchnet::make_buffer(branchnet::branch::request{msg});
    auto out = branchnet::from_buffer<branchnet::branch::request>(buf);
    ASSERT_TRUE(out.has_value());
    auto& got
        = std::get<branchnet::branch::inter_branch_transfer_request>(*out);
    ASSERT_FALSE(got.m_tx_id.has_value());
    ASSERT_EQ(got.m_dst_endpoint, msg.m_dst_endpoint);
    ASSERT_EQ(got.m_amount, 300);

    msg.m_tx_id = "client-chosen";
    buf = branchnet::make_buffer(branchnet::branch::request{msg});
    out = branchnet::from_buffer<branchnet::branch::request>(buf);
    ASSERT_TRUE(out.has_value());
    auto& named
        = std::get<branchnet::branch::inter_branch_transfer_request>(*out);
    ASSERT_EQ(named.m_tx_id.value(), "client-chosen");
}

TEST_F(serialization_test, error_response) {
    auto err = branchnet::error{
        branchnet::error_code::insufficient_funds,
        "balance 100 below 300"};
    auto buf = branchnet::make_buffer(branchnet::branch::response{err});
    auto out = branchnet::from_buffer<branchnet::branch::response>(buf);
    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(std::holds_alternative<branchnet::error>(*out));
    ASSERT_EQ(std::get<branchnet::error>(*out), err);
}

TEST_F(serialization_test, unresolved_records) {
    auto resp = branchnet::branch::list_unresolved_response{};
    resp.m_records.push_back(m_record);
    auto buf = branchnet::make_buffer(branchnet::branch::response{resp});
    auto out = branchnet::from_buffer<branchnet::branch::response>(buf);
    ASSERT_TRUE(out.has_value());
    auto& recs
        = std::get<branchnet::branch::list_unresolved_response>(*out)
              .m_records;
    ASSERT_EQ(recs.size(), 1U);
    ASSERT_EQ(recs[0].m_tx_id, m_record.m_tx_id);
    ASSERT_EQ(recs[0].m_dst_endpoint, m_record.m_dst_endpoint);
    ASSERT_EQ(recs[0].m_phase, m_record.m_phase);
    ASSERT_TRUE(recs[0].m_unresolved);
    ASSERT_EQ(recs[0].m_reason.value(), m_record.m_reason.value());
    ASSERT_EQ(recs[0].m_created, 1234U);
    ASSERT_TRUE(recs[0].m_deliver_src);
    ASSERT_FALSE(recs[0].m_deliver_dst);
}

TEST_F(serialization_test, trailing_bytes_rejected) {
    auto buf = branchnet::make_buffer(m_account);
    auto extra = uint8_t{1};
    buf.append(&extra, sizeof(extra));
    auto acc = branchnet::from_buffer<branchnet::ledger::account>(buf);
    ASSERT_FALSE(acc.has_value());
}

TEST_F(serialization_test, truncated_rejected) {
    auto buf = branchnet::make_buffer(m_record);
    auto truncated = branchnet::buffer();
    truncated.append(buf.data(), buf.size() - 1);
    auto rec
        = branchnet::from_buffer<branchnet::coordinator::record>(truncated);
    ASSERT_FALSE(rec.has_value());
}

TEST_F(serialization_test, unknown_request_kind_rejected) {
    auto buf = branchnet::buffer();
    auto idx = uint8_t{200};
    buf.append(&idx, sizeof(idx));
    auto req = branchnet::from_buffer<branchnet::branch::request>(buf);
    ASSERT_FALSE(req.has_value());
}

TEST_F(serialization_test, error_code_names) {
    ASSERT_EQ(
        branchnet::to_string(branchnet::error_code::timeout),
        "TIMEOUT");
    ASSERT_EQ(branchnet::to_string(
                  branchnet::error_code::insufficient_funds),
              "INSUFFICIENT_FUNDS");
}

TEST_F(serialization_test, integers_big_endian) {
    auto buf = branchnet::make_buffer(uint32_t{0x0a0b0c0d});
    ASSERT_EQ(buf.to_hex(), "0a0b0c0d");
    auto neg = branchnet::make_buffer(int16_t{-2});
    ASSERT_EQ(neg.to_hex(), "fffe");
    auto back = branchnet::from_buffer<int16_t>(neg);
    ASSERT_EQ(back.value(), -2);
}

TEST_F(serialization_test, bool_out_of_range_rejected) {
    auto buf = branchnet::buffer();
    auto flag = uint8_t{2};
    buf.append(&flag, sizeof(flag));
    ASSERT_FALSE(branchnet::from_buffer<bool>(buf).has_value());
}

TEST_F(serialization_test, enum_out_of_range_rejected) {
    auto set_byte = [](branchnet::buffer& buf, size_t offset, uint8_t val) {
        static_cast<uint8_t*>(buf.data())[offset] = val;
    };

    auto params = branchnet::participant::prepare_params{
        "t",
        branchnet::participant::side::debit,
        1001,
        250};
    auto side_at = branchnet::make_buffer(params.m_tx_id).size();
    auto buf = branchnet::make_buffer(params);
    set_byte(buf, side_at, 7);
    ASSERT_FALSE(
        branchnet::from_buffer<branchnet::participant::prepare_params>(buf)
            .has_value());
    set_byte(buf, side_at, 1);
    auto credit
        = branchnet::from_buffer<branchnet::participant::prepare_params>(buf);
    ASSERT_TRUE(credit.has_value());
    ASSERT_EQ(credit->m_side, branchnet::participant::side::credit);

    auto rec = branchnet::participant::record{};
    rec.m_account_no = 1001;
    rec.m_amount = 250;
    auto state_at = branchnet::make_buffer(rec.m_side).size()
                  + branchnet::make_buffer(rec.m_account_no).size()
                  + branchnet::make_buffer(rec.m_amount).size();
    buf = branchnet::make_buffer(rec);
    set_byte(buf, state_at, 4);
    ASSERT_FALSE(branchnet::from_buffer<branchnet::participant::record>(buf)
                     .has_value());

    auto entry = branchnet::ledger::log_entry{};
    entry.m_tx_id = "t";
    auto kind_at = branchnet::make_buffer(entry.m_seq).size()
                 + branchnet::make_buffer(entry.m_timestamp).size();
    buf = branchnet::make_buffer(entry);
    set_byte(buf, kind_at, 6);
    ASSERT_FALSE(branchnet::from_buffer<branchnet::ledger::log_entry>(buf)
                     .has_value());

    auto err = branchnet::error{branchnet::error_code::timeout, "slow"};
    auto resp = branchnet::make_buffer(branchnet::branch::response{err});
    auto code_at = resp.size() - branchnet::make_buffer(err).size();
    set_byte(resp, code_at, 200);
    ASSERT_FALSE(
        branchnet::from_buffer<branchnet::branch::response>(resp).has_value());

    auto phase_at = branchnet::make_buffer(m_record.m_tx_id).size()
                  + branchnet::make_buffer(m_record.m_src_account).size()
                  + branchnet::make_buffer(m_record.m_dst_endpoint).size()
                  + branchnet::make_buffer(m_record.m_dst_account).size()
                  + branchnet::make_buffer(m_record.m_amount).size();
    buf = branchnet::make_buffer(m_record);
    set_byte(buf, phase_at, 2);
    auto aborting
        = branchnet::from_buffer<branchnet::coordinator::record>(buf);
    ASSERT_TRUE(aborting.has_value());
    ASSERT_EQ(aborting->m_phase, branchnet::coordinator::tx_phase::aborting);
    set_byte(buf, phase_at, 3);
    ASSERT_FALSE(branchnet::from_buffer<branchnet::coordinator::record>(buf)
                     .has_value());

    auto result = branchnet::coordinator::result{
        branchnet::coordinator::outcome::committed,
        "t",
        std::nullopt};
    buf = branchnet::make_buffer(result);
    set_byte(buf, 0, 3);
    ASSERT_FALSE(branchnet::from_buffer<branchnet::coordinator::result>(buf)
                     .has_value());
}

TEST_F(serialization_test, oversized_length_rejected) {
    // Claims far more elements than the input holds.
    auto buf = branchnet::make_buffer(uint64_t{1} << 40U);
    auto name = uint8_t{'x'};
    buf.append(&name, sizeof(name));
    ASSERT_FALSE(branchnet::from_buffer<std::string>(buf).has_value());
    ASSERT_FALSE(
        branchnet::from_buffer<std::vector<uint64_t>>(buf).has_value());
}
