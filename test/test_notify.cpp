#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "paykit/notify/notify.hpp"
#include "paykit/params/xml_map.hpp"
#include "test_helpers.hpp"

using namespace paykit;
using namespace paykit::notify;
using params::ParamMap;

namespace {

const std::string WECHAT_FAIL =
    "<xml><return_code><![CDATA[FAIL]]></return_code><return_msg><![CDATA[FAIL]]></return_msg></xml>";
const std::string WECHAT_SUCCESS =
    "<xml><return_code><![CDATA[SUCCESS]]></return_code><return_msg><![CDATA[OK]]></return_msg></xml>";

ChannelConfig SecretChannel(Channel channel, const std::string& secret, const std::string& algorithm = "") {
    ChannelConfig config;
    config.channel = channel;
    config.algorithm = algorithm;
    config.key.secret = secret;
    return config;
}

ParamMap WechatPayment() {
    ParamMap params;
    params.Set("appid", "wx2421b1c4370ec43b")
          .Set("mch_id", "10000100")
          .Set("nonce_str", "5K8264ILTKCH16CQ2502SI8ZNMTM67VS")
          .Set("out_trade_no", "A1")
          .Set("result_code", "SUCCESS")
          .Set("return_code", "SUCCESS")
          .Set("attach", "Tom's <Café> & Bar")
          .Set("total_fee", "1");
    return params;
}

// 用同一渠道配置生成已签名的通知报文
std::string SignedNotification(const ChannelSigner& signer, ParamMap params) {
    auto sig = signer.SignRequest(params);
    REQUIRE(sig.ok());
    auto encoded = signer.EncodeRequest(params);
    REQUIRE(encoded.ok());
    return encoded.value();
}

} // namespace

TEST_CASE("渠道信息测试", "[notify][channel]") {

    SECTION("渠道名称") {
        for (auto channel : {Channel::Alipay, Channel::Wechat, Channel::QQ, Channel::AllinPay, Channel::Saobei}) {
            auto parsed = ParseChannel(ChannelName(channel));
            REQUIRE(parsed.ok());
            REQUIRE(parsed.value() == channel);
        }
        auto unknown = ParseChannel("Wechat");
        REQUIRE_FALSE(unknown.ok());
        REQUIRE(unknown.error().code() == ErrorCode::ConfigError);
    }

    SECTION("默认签名串规则") {
        REQUIRE(DefaultProfile(Channel::Wechat, HMAC_SHA256_SIGN) == params::ProfileKind::KeyedMac);
        REQUIRE(DefaultProfile(Channel::Wechat, MD5_SIGN) == params::ProfileKind::KeyedDigest);
        REQUIRE(DefaultProfile(Channel::Alipay, RSA2_SIGN) == params::ProfileKind::Asymmetric);
        REQUIRE(DefaultProfile(Channel::AllinPay, MD5_SIGN) == params::ProfileKind::KeyedDigest);
        REQUIRE(DefaultProfile(Channel::Saobei, HMAC_SHA256_SIGN) == params::ProfileKind::Mac);
    }

    SECTION("应答报文") {
        REQUIRE(GetChannelInfo(Channel::Wechat).successAck == WECHAT_SUCCESS);
        REQUIRE(GetChannelInfo(Channel::QQ).failureAck == WECHAT_FAIL);
        REQUIRE(GetChannelInfo(Channel::Alipay).successAck == "success");
        REQUIRE(GetChannelInfo(Channel::Alipay).failureAck == "failure");
        REQUIRE(GetChannelInfo(Channel::AllinPay).failureAck == "fail");
        REQUIRE(GetChannelInfo(Channel::Saobei).successAck == R"({"return_code":"01","return_msg":"success"})");
    }
}

TEST_CASE("渠道签名器测试", "[notify][channel]") {
    auto registry = crypto::SignerRegistry::NewDefault();

    SECTION("MD5签名串与签名") {
        auto signer = ChannelSigner::Create(SecretChannel(Channel::AllinPay, "secret"), *registry);
        REQUIRE(signer.ok());

        ParamMap params;
        params.Set("total_amount", "0.01").Set("out_trade_no", "A1");
        REQUIRE(signer.value().SigningString(params) == "out_trade_no=A1&total_amount=0.01&key=secret");

        auto sig = signer.value().SignRequest(params);
        REQUIRE(sig.ok());
        REQUIRE(sig.value() == "F0F8FA33DF77249D6F1A55C80F32FE44");
        REQUIRE(params.GetString("sign") == "F0F8FA33DF77249D6F1A55C80F32FE44");
        REQUIRE(signer.value().EncodeRequest(params).value() ==
                "total_amount=0.01&out_trade_no=A1&sign=F0F8FA33DF77249D6F1A55C80F32FE44");
    }

    SECTION("微信默认HMAC-SHA256并在串尾拼接key") {
        auto signer = ChannelSigner::Create(SecretChannel(Channel::Wechat, "secret"), *registry);
        REQUIRE(signer.ok());
        REQUIRE(signer.value().GetSigner().Algorithm() == HMAC_SHA256_SIGN);
        REQUIRE(signer.value().Profile().kind == params::ProfileKind::KeyedMac);

        ParamMap params;
        params.Set("out_trade_no", "A1").Set("total_amount", "0.01");
        auto sig = signer.value().SignRequest(params);
        REQUIRE(sig.ok());
        REQUIRE(sig.value() == "D15E78A154CE15572A053748E07628E51A78BC9A3D8BE5604B1C1E8C40C4FD82");
        REQUIRE(signer.value().EncodeRequest(params).value() ==
                "<xml><out_trade_no>A1</out_trade_no><total_amount>0.01</total_amount>"
                "<sign>D15E78A154CE15572A053748E07628E51A78BC9A3D8BE5604B1C1E8C40C4FD82</sign></xml>");
    }

    SECTION("显式指定mac规则") {
        ChannelConfig config = SecretChannel(Channel::Saobei, "secret", HMAC_SHA256_SIGN);
        config.profile = params::ProfileKind::Mac;
        auto signer = ChannelSigner::Create(config, *registry);
        REQUIRE(signer.ok());

        ParamMap params;
        params.Set("out_trade_no", "A1").Set("total_amount", "0.01");
        auto sig = signer.value().SignRequest(params);
        REQUIRE(sig.ok());
        REQUIRE(sig.value() == "85144290FC24F638818135BD3D64CF4E07BE47633118C058EF5B8352D9DAE555");
        REQUIRE(signer.value().EncodeRequest(params).value() ==
                R"({"out_trade_no":"A1","total_amount":"0.01","sign":"85144290FC24F638818135BD3D64CF4E07BE47633118C058EF5B8352D9DAE555"})");
    }

    SECTION("配置错误在构造时暴露") {
        auto unknown = ChannelSigner::Create(SecretChannel(Channel::Wechat, "secret", "FOO"), *registry);
        REQUIRE_FALSE(unknown.ok());
        REQUIRE(unknown.error().code() == ErrorCode::UnsupportedAlgorithm);

        auto noSecret = ChannelSigner::Create(SecretChannel(Channel::Wechat, ""), *registry);
        REQUIRE_FALSE(noSecret.ok());
        REQUIRE(noSecret.error().code() == ErrorCode::InvalidKeyMaterial);

        ChannelConfig rsa;
        rsa.channel = Channel::Alipay;
        auto noKey = ChannelSigner::Create(rsa, *registry);
        REQUIRE_FALSE(noKey.ok());
        REQUIRE(noKey.error().code() == ErrorCode::InvalidKeyMaterial);

        // 不带密钥的摘要配上不拼接密钥的规则
        ChannelConfig unkeyed = SecretChannel(Channel::AllinPay, "secret", MD5_SIGN);
        unkeyed.profile = params::ProfileKind::Mac;
        auto weak = ChannelSigner::Create(unkeyed, *registry);
        REQUIRE_FALSE(weak.ok());
        REQUIRE(weak.error().code() == ErrorCode::ConfigError);
    }

    SECTION("XML渠道拒绝非法元素名") {
        auto signer = ChannelSigner::Create(SecretChannel(Channel::Wechat, "secret"), *registry);
        REQUIRE(signer.ok());

        ParamMap params;
        params.Set("out_trade_no", "A1").Set("1st_item", "apple");
        auto encoded = signer.value().EncodeRequest(params);
        REQUIRE_FALSE(encoded.ok());
        REQUIRE(encoded.error().code() == ErrorCode::FormatError);
        REQUIRE(encoded.error().what().find("1st_item") != std::string::npos);

        // 表单渠道不受元素名限制
        auto form = ChannelSigner::Create(SecretChannel(Channel::AllinPay, "secret"), *registry);
        REQUIRE(form.ok());
        auto text = form.value().EncodeRequest(params);
        REQUIRE(text.ok());
        REQUIRE(text.value() == "out_trade_no=A1&1st_item=apple");
    }

    SECTION("默认构造的渠道签名器不能签名") {
        ChannelSigner unset;
        ParamMap params;
        params.Set("out_trade_no", "A1");
        auto sig = unset.SignRequest(params);
        REQUIRE_FALSE(sig.ok());
        REQUIRE(sig.error().code() == ErrorCode::SignFailure);
        REQUIRE_FALSE(params.Contains("sign"));
    }
}

TEST_CASE("XML渠道异步通知测试", "[notify]") {
    auto registry = crypto::SignerRegistry::NewDefault();
    auto verifier = NotifyVerifier::Create(SecretChannel(Channel::Wechat, "secret"), *registry);
    REQUIRE(verifier.ok());
    const std::string raw = SignedNotification(verifier.value().GetChannelSigner(), WechatPayment());

    SECTION("验签成功后调用回调") {
        int calls = 0;
        ParamMap received;
        auto outcome = verifier.value().Process(raw, [&](const ParamMap& fields) -> Result<bool> {
            ++calls;
            received = fields;
            return true;
        });

        REQUIRE(outcome.Acknowledged());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.state == NotifyState::Acknowledged);
        REQUIRE(outcome.lastState == NotifyState::Dispatched);
        REQUIRE(outcome.error.ok());
        REQUIRE(outcome.acknowledgement == WECHAT_SUCCESS);
        REQUIRE(calls == 1);
        REQUIRE(received.GetString("attach") == "Tom's <Café> & Bar");
        REQUIRE_FALSE(received.Contains("sign"));
    }

    SECTION("签名错误被拒绝且不调用回调") {
        auto tampered = params::XmlMap::Parse(raw);
        REQUIRE(tampered.ok());
        params::XmlMap doc = tampered.value();
        doc.Set("sign", "0000000000000000000000000000000000000000000000000000000000000000");

        bool called = false;
        auto outcome = verifier.value().Process(doc.Serialize(), [&](const ParamMap&) -> Result<bool> {
            called = true;
            return true;
        });

        REQUIRE(outcome.state == NotifyState::Rejected);
        REQUIRE(outcome.lastState == NotifyState::Parsed);
        REQUIRE(outcome.error.code() == ErrorCode::SignatureError);
        REQUIRE(outcome.acknowledgement == WECHAT_FAIL);
        REQUIRE_FALSE(called);
    }

    SECTION("字段被篡改") {
        auto tampered = params::XmlMap::Parse(raw);
        REQUIRE(tampered.ok());
        params::XmlMap doc = tampered.value();
        doc.Set("total_fee", "100");

        auto outcome = verifier.value().Process(doc.Serialize(), nullptr);
        REQUIRE(outcome.error.code() == ErrorCode::SignatureError);
        REQUIRE(outcome.acknowledgement == WECHAT_FAIL);
    }

    SECTION("缺少签名字段") {
        auto outcome = verifier.value().Process(
            "<xml><return_code>SUCCESS</return_code><out_trade_no>A1</out_trade_no></xml>", nullptr);
        REQUIRE(outcome.state == NotifyState::Rejected);
        REQUIRE(outcome.error.code() == ErrorCode::SignatureError);
        REQUIRE(outcome.acknowledgement == WECHAT_FAIL);
    }

    SECTION("空报文与格式错误") {
        auto empty = verifier.value().Process("", nullptr);
        REQUIRE(empty.state == NotifyState::Rejected);
        REQUIRE(empty.lastState == NotifyState::Received);
        REQUIRE(empty.error.code() == ErrorCode::FormatError);
        REQUIRE(empty.acknowledgement == WECHAT_FAIL);
        REQUIRE_FALSE(empty.fields.has_value());

        auto broken = verifier.value().Process("<xml><sign>ABC</sign>", nullptr);
        REQUIRE(broken.lastState == NotifyState::Received);
        REQUIRE(broken.error.code() == ErrorCode::FormatError);
        REQUIRE(broken.acknowledgement == WECHAT_FAIL);

        auto wrongRoot = verifier.value().Process("<root><sign>ABC</sign></root>", nullptr);
        REQUIRE(wrongRoot.error.code() == ErrorCode::FormatError);
    }

    SECTION("重复投递得到相同应答") {
        int calls = 0;
        auto callback = [&](const ParamMap&) -> Result<bool> {
            ++calls;
            return true;
        };
        auto first = verifier.value().Process(raw, callback);
        auto second = verifier.value().Process(raw, callback);

        REQUIRE(first.acknowledgement == second.acknowledgement);
        REQUIRE(first.acknowledgement == WECHAT_SUCCESS);
        // 不做去重
        REQUIRE(calls == 2);
    }

    SECTION("回调返回失败") {
        auto outcome = verifier.value().Process(raw, [](const ParamMap&) -> Result<bool> {
            return false;
        });
        // 已验签并分发，仍以失败应答结束
        REQUIRE(outcome.state == NotifyState::Acknowledged);
        REQUIRE(outcome.lastState == NotifyState::Dispatched);
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error.code() == ErrorCode::CallbackFailure);
        REQUIRE(outcome.acknowledgement == WECHAT_FAIL);
        REQUIRE(outcome.fields.has_value());
    }

    SECTION("回调返回错误") {
        auto outcome = verifier.value().Process(raw, [](const ParamMap&) -> Result<bool> {
            return Error(ErrorCode::FormatError, "订单不存在");
        });
        REQUIRE(outcome.state == NotifyState::Acknowledged);
        REQUIRE(outcome.lastState == NotifyState::Dispatched);
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error.code() == ErrorCode::CallbackFailure);
        REQUIRE(outcome.error.what().find("订单不存在") != std::string::npos);
        REQUIRE(outcome.acknowledgement == WECHAT_FAIL);
    }

    SECTION("回调抛异常") {
        auto outcome = verifier.value().Process(raw, [](const ParamMap&) -> Result<bool> {
            throw std::runtime_error("db down");
        });
        REQUIRE(outcome.state == NotifyState::Acknowledged);
        REQUIRE(outcome.lastState == NotifyState::Dispatched);
        REQUIRE_FALSE(outcome.Succeeded());
        REQUIRE(outcome.error.code() == ErrorCode::CallbackFailure);
        REQUIRE(outcome.acknowledgement == WECHAT_FAIL);

        auto unknown = verifier.value().Process(raw, [](const ParamMap&) -> Result<bool> {
            throw 42;
        });
        REQUIRE(unknown.state == NotifyState::Acknowledged);
        REQUIRE_FALSE(unknown.Succeeded());
        REQUIRE(unknown.error.code() == ErrorCode::CallbackFailure);
        REQUIRE(unknown.acknowledgement == WECHAT_FAIL);
    }

    SECTION("未提供回调视为成功") {
        auto outcome = verifier.value().Process(raw, nullptr);
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.acknowledgement == WECHAT_SUCCESS);
    }

    SECTION("转换为统一返回值") {
        auto ok = verifier.value().Process(raw, nullptr).ToResponse();
        REQUIRE(ok.IsSuccess());
        REQUIRE(ok.RawResponse().value() == WECHAT_SUCCESS);
        REQUIRE(ok.Data().value()["fields"]["out_trade_no"] == "A1");

        auto rejected = verifier.value().Process("", nullptr).ToResponse();
        REQUIRE_FALSE(rejected.IsSuccess());
        REQUIRE(rejected.Code().value() == "FORMAT_ERROR");
        REQUIRE(rejected.RawResponse().value() == WECHAT_FAIL);
        REQUIRE_FALSE(rejected.Data().has_value());

        auto failed = verifier.value().Process(raw, [](const ParamMap&) -> Result<bool> {
            return false;
        }).ToResponse();
        REQUIRE_FALSE(failed.IsSuccess());
        REQUIRE(failed.Code().value() == "CALLBACK_FAILURE");
        REQUIRE(failed.RawResponse().value() == WECHAT_FAIL);
    }
}

TEST_CASE("未配置的验签器拒绝所有通知", "[notify]") {
    NotifyVerifier unset;

    // 无密钥MD5伪造的签名
    const std::string forged =
        "<xml><out_trade_no>A1</out_trade_no><total_fee>1</total_fee>"
        "<sign>768516146F2FBD1EBD6F86C8525D5F76</sign></xml>";

    bool called = false;
    auto outcome = unset.Process(forged, [&](const ParamMap&) -> Result<bool> {
        called = true;
        return true;
    });
    REQUIRE(outcome.state == NotifyState::Rejected);
    REQUIRE_FALSE(outcome.Succeeded());
    REQUIRE(outcome.error.code() == ErrorCode::SignatureError);
    REQUIRE(outcome.acknowledgement == WECHAT_FAIL);
    REQUIRE_FALSE(called);
    REQUIRE_FALSE(unset.GetChannelSigner().GetSigner().IsConfigured());
}

TEST_CASE("表单与JSON渠道异步通知测试", "[notify]") {
    auto registry = crypto::SignerRegistry::NewDefault();

    SECTION("通联MD5表单通知") {
        auto verifier = NotifyVerifier::Create(SecretChannel(Channel::AllinPay, "secret"), *registry);
        REQUIRE(verifier.ok());

        // 空值字段不参与签名
        auto outcome = verifier.value().Process(
            "out_trade_no=A1&total_amount=0.01&memo=&sign=f0f8fa33df77249d6f1a55c80f32fe44",
            [](const ParamMap& fields) -> Result<bool> {
                return fields.GetString("out_trade_no") == "A1";
            });
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.acknowledgement == "success");

        auto bad = verifier.value().Process("out_trade_no=A1&total_amount=0.02&sign=F0F8FA33DF77249D6F1A55C80F32FE44", nullptr);
        REQUIRE(bad.error.code() == ErrorCode::SignatureError);
        REQUIRE(bad.acknowledgement == "fail");

        auto malformed = verifier.value().Process("out_trade_no=%ZZ&sign=x", nullptr);
        REQUIRE(malformed.error.code() == ErrorCode::FormatError);
        REQUIRE(malformed.acknowledgement == "fail");
    }

    SECTION("扫呗JSON通知") {
        auto verifier = NotifyVerifier::Create(SecretChannel(Channel::Saobei, "secret"), *registry);
        REQUIRE(verifier.ok());

        auto outcome = verifier.value().Process(
            R"({"out_trade_no":"A1","total_amount":"0.01","sign":"F0F8FA33DF77249D6F1A55C80F32FE44"})",
            nullptr);
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.acknowledgement == R"({"return_code":"01","return_msg":"success"})");

        auto broken = verifier.value().Process("{not json", nullptr);
        REQUIRE(broken.error.code() == ErrorCode::FormatError);
        REQUIRE(broken.acknowledgement == R"({"return_code":"02","return_msg":"fail"})");
    }

    SECTION("支付宝RSA2通知排除sign_type") {
        auto pair = testing::GenerateRSAKeyPair();
        ChannelConfig config;
        config.channel = Channel::Alipay;
        config.key.privateKey = pair.privateKey;
        config.key.publicKey = testing::StripPEM(pair.publicKey);

        auto verifier = NotifyVerifier::Create(config, *registry);
        REQUIRE(verifier.ok());
        const ChannelSigner& signer = verifier.value().GetChannelSigner();

        ParamMap fields;
        fields.Set("app_id", "2021000000000000")
              .Set("out_trade_no", "A1")
              .Set("trade_status", "TRADE_SUCCESS")
              .Set("total_amount", "0.01")
              .Set("sign_type", "RSA2");

        // 出站签名包含 sign_type，通知验签不包含
        REQUIRE(signer.SigningString(fields).find("sign_type=RSA2") != std::string::npos);
        REQUIRE(signer.NotifySigningString(fields).find("sign_type") == std::string::npos);

        auto sig = signer.GetSigner().Sign(signer.NotifySigningString(fields));
        REQUIRE(sig.ok());
        fields.Set("sign", sig.value());

        auto outcome = verifier.value().Process(fields.ToQueryText().value(), nullptr);
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.acknowledgement == "success");
        REQUIRE(outcome.fields->GetString("sign_type") == "RSA2");

        fields.Set("total_amount", "100.00");
        auto tampered = verifier.value().Process(fields.ToQueryText().value(), nullptr);
        REQUIRE(tampered.error.code() == ErrorCode::SignatureError);
        REQUIRE(tampered.acknowledgement == "failure");
    }
}
