//
// Created by jonas on 15.06.21.
//

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include "WorkCompletion.hpp"

namespace {
    ibv_wc makeWc(WrId id, enum ibv_wc_status status, enum ibv_wc_opcode opcode) {
        ibv_wc wc{};
        wc.wr_id = id;
        wc.status = status;
        wc.opcode = opcode;
        wc.qp_num = 0x2a;
        return wc;
    }
}

TEST(WorkCompletion, SuccessfulReceive) {
    auto wc = makeWc(3, IBV_WC_SUCCESS, IBV_WC_RECV);
    wc.byte_len = 64;
    WorkCompletion completion(wc);
    EXPECT_EQ(completion.wrId(), 3u);
    EXPECT_TRUE(completion.ok());
    EXPECT_TRUE(completion.isReceive());
    EXPECT_EQ(completion.byteLength(), 64u);
    EXPECT_EQ(completion.qpNum(), 0x2au);
    EXPECT_FALSE(completion.immData().has_value());
    EXPECT_NO_THROW(completion.expectSuccess());
}

TEST(WorkCompletion, ImmediateDataInHostOrder) {
    auto wc = makeWc(4, IBV_WC_SUCCESS, IBV_WC_RECV_RDMA_WITH_IMM);
    wc.wc_flags = IBV_WC_WITH_IMM;
    wc.imm_data = htonl(0xdeadbeef);
    WorkCompletion completion(wc);
    EXPECT_TRUE(completion.isReceive());
    ASSERT_TRUE(completion.immData().has_value());
    EXPECT_EQ(*completion.immData(), 0xdeadbeefu);
}

TEST(WorkCompletion, SendSideOpcodesAreNoReceives) {
    EXPECT_FALSE(WorkCompletion(makeWc(1, IBV_WC_SUCCESS, IBV_WC_SEND)).isReceive());
    EXPECT_FALSE(WorkCompletion(makeWc(1, IBV_WC_SUCCESS, IBV_WC_RDMA_WRITE)).isReceive());
    EXPECT_FALSE(WorkCompletion(makeWc(1, IBV_WC_SUCCESS, IBV_WC_DRIVER2)).isReceive());
}

TEST(WorkCompletion, FailureIsReportedNotThrown) {
    WorkCompletion completion(makeWc(7, IBV_WC_REM_ACCESS_ERR, IBV_WC_RDMA_WRITE));
    EXPECT_FALSE(completion.ok());
    EXPECT_EQ(completion.status(), IBV_WC_REM_ACCESS_ERR);
    EXPECT_EQ(completion.errorKind(), ErrorKind::RemoteAccess);
    try {
        completion.expectSuccess();
        FAIL() << "expected IBvException";
    } catch (const IBvException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::RemoteAccess);
        EXPECT_NE(std::string(e.what()).find("Work request 7"), std::string::npos);
    }
}

TEST(WorkCompletionDeathTest, ErrorKindOfSuccessTerminates) {
    WorkCompletion completion(makeWc(1, IBV_WC_SUCCESS, IBV_WC_SEND));
    EXPECT_DEATH((void) completion.errorKind(), "precondition violated");
}
