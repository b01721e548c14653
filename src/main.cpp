#include "chunk_assembler.hpp"
#include "chunk_producer.hpp"
#include "crypto_oracle.hpp"

#include <chrono>
#include <csignal>
#include <deque>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

// In-process network of validators: one produces a chunk for shard 0, the
// others assemble it from pushed parts and tick-driven requests over a lossy
// loopback link.

static volatile std::sig_atomic_t should_exit = 0;

void signal_handler(int sig) {
    std::cout << "\nReceived signal " << sig << ", stopping simulation..." << std::endl;
    should_exit = 1;
}

constexpr int MAX_ROUNDS = 400;
constexpr auto ROUND_DURATION = std::chrono::milliseconds(50);

struct Message {
    enum class Kind { Request, Part, ReceiptProof };

    Kind kind;
    PeerId from;
    PeerId to;
    ChunkId id;
    PartIndex index = 0;
    ChunkPart part;
    ReceiptProof proof;
};

class LoopbackNetwork {
public:
    LoopbackNetwork(double loss_rate, uint32_t seed) : loss_rate_(loss_rate), rng_(seed) {}

    void send(Message msg) {
        sent_++;
        if (dist_(rng_) < loss_rate_) {
            dropped_++;
            return;
        }
        queue_.push_back(std::move(msg));
    }

    std::deque<Message> drain() {
        std::deque<Message> out;
        out.swap(queue_);
        return out;
    }

    uint64_t sent() const { return sent_; }
    uint64_t dropped() const { return dropped_; }

private:
    double loss_rate_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
    std::deque<Message> queue_;
    uint64_t sent_ = 0;
    uint64_t dropped_ = 0;
};

class LoopbackTransport : public PartTransport {
public:
    LoopbackTransport(PeerId self, LoopbackNetwork& net) : self_(std::move(self)), net_(net) {}

    void request_part(const PeerId& target, const ChunkId& id, PartIndex index) override {
        Message m{Message::Kind::Request, self_, target, id};
        m.index = index;
        net_.send(std::move(m));
    }

    void send_part(const PeerId& target, const ChunkId& id, const ChunkPart& part) override {
        Message m{Message::Kind::Part, self_, target, id};
        m.part = part;
        net_.send(std::move(m));
    }

    void send_receipt_proof(const PeerId& target, const ChunkId& id, const ReceiptProof& proof) override {
        Message m{Message::Kind::ReceiptProof, self_, target, id};
        m.proof = proof;
        net_.send(std::move(m));
    }

private:
    PeerId self_;
    LoopbackNetwork& net_;
};

class AlwaysValidBlocks : public BlockOracle {
public:
    bool is_header_for_valid_block(const ChunkHeader&) override { return true; }
};

struct Validator {
    PeerId id;
    std::unique_ptr<LoopbackTransport> transport;
    std::unique_ptr<PeerSelector> selector;
    std::unique_ptr<ChunkAssembler> assembler;
};

ChunkPayload make_demo_payload(size_t tx_count, std::mt19937& rng) {
    ChunkPayload payload;
    std::uniform_int_distribution<int> byte(0, 255);
    for (size_t i = 0; i < tx_count; ++i) {
        Transaction tx;
        tx.signer_id = "account" + std::to_string(i % 17);
        tx.nonce = i + 1;
        tx.body.resize(64 + (i % 5) * 32);
        for (auto& b : tx.body) b = static_cast<uint8_t>(byte(rng));
        payload.transactions.push_back(std::move(tx));

        if (i % 4 == 0) {
            Receipt r;
            r.receipt_id = sha256(payload.transactions.back().body);
            r.destination_shard = 0;
            r.predecessor_id = payload.transactions.back().signer_id;
            r.receiver_id = "contract" + std::to_string(i % 3);
            r.body.assign(16, static_cast<uint8_t>(i));
            payload.outgoing_receipts.push_back(std::move(r));
        }
    }
    return payload;
}

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <validators> <data_parts> <parity_parts> [loss_percent] [seed]" << std::endl;
        std::cerr << "Example: " << argv[0] << " 6 4 8 20" << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int validator_count = 0;
    ChunkProductionParams params;
    double loss_rate = 0.0;
    uint32_t seed = std::random_device{}();
    try {
        validator_count = std::stoi(argv[1]);
        params.data_parts = static_cast<uint32_t>(std::stoul(argv[2]));
        params.parity_parts = static_cast<uint32_t>(std::stoul(argv[3]));
        if (argc > 4) loss_rate = std::stod(argv[4]) / 100.0;
        if (argc > 5) seed = static_cast<uint32_t>(std::stoul(argv[5]));
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }
    if (validator_count < 2) {
        std::cerr << "Need at least 2 validators" << std::endl;
        return 1;
    }

    std::cout << "Simulating " << validator_count << " validators, D=" << params.data_parts
              << " P=" << params.parity_parts << ", loss " << loss_rate * 100.0 << "%, seed " << seed << std::endl;

    std::unique_ptr<Ed25519Signer> producer_key = Ed25519Signer::generate();
    PublicKey producer_public = producer_key->public_key();
    Ed25519CryptoOracle crypto([producer_public](ShardId, BlockHeight) -> std::optional<PublicKey> {
        return producer_public;
    });
    AlwaysValidBlocks blocks;
    LoopbackNetwork net(loss_rate, seed);

    std::vector<Validator> validators(validator_count);
    for (int i = 0; i < validator_count; ++i) {
        Validator& v = validators[i];
        v.id = "v" + std::to_string(i);

        AssemblerConfig config;
        config.self_id = v.id;
        v.transport = std::make_unique<LoopbackTransport>(v.id, net);
        // Part i is owned by validator i mod n; everyone else is a fallback
        PartCandidatesFn candidates = [validator_count, self = v.id](const ChunkId&, PartIndex index) {
            std::vector<PeerId> peers;
            for (int k = 0; k < validator_count; ++k) {
                PeerId peer = "v" + std::to_string((index + k) % validator_count);
                if (peer != self) peers.push_back(peer);
            }
            return peers;
        };
        v.selector = std::make_unique<WeightedPeerSelector>(candidates, seed + i);
        v.assembler = std::make_unique<ChunkAssembler>(
            config, crypto, blocks, *v.transport, *v.selector,
            [&v](Chunk chunk) {
                std::cout << "[" << v.id << "] Chunk ready: " << chunk.payload.transactions.size()
                          << " txs, " << chunk.payload.outgoing_receipts.size() << " receipts" << std::endl;
            });
    }

    std::mt19937 rng(seed);
    params.shard_id = 0;
    params.height = 1;
    params.num_shards = 1;
    params.prev_block_hash = sha256(std::vector<uint8_t>{'g', 'e', 'n', 'e', 's', 'i', 's'});

    EncodedChunk chunk;
    try {
        chunk = produce_encoded_chunk(make_demo_payload(48, rng), params, *producer_key);
    } catch (const std::exception& e) {
        std::cerr << "[PRODUCER] " << e.what() << std::endl;
        return 1;
    }
    const ChunkId id = ChunkId::of(chunk.header);

    // Headers travel with blocks, so every validator sees it
    for (auto& v : validators) v.assembler->on_header_seen(chunk.header);

    DistributionPlan plan;
    plan.part_owners = [validator_count](const ChunkId&, PartIndex index) {
        return std::vector<PeerId>{"v" + std::to_string(index % validator_count)};
    };
    plan.receipt_recipients = [&validators](ShardId) {
        std::vector<PeerId> peers;
        for (const auto& v : validators) peers.push_back(v.id);
        return peers;
    };
    validators[0].assembler->distribute_chunk(chunk, plan);

    auto find_validator = [&validators](const PeerId& peer) -> Validator* {
        for (auto& v : validators) {
            if (v.id == peer) return &v;
        }
        return nullptr;
    };

    auto now = Clock::now();
    int round = 0;
    for (; round < MAX_ROUNDS && !should_exit; ++round) {
        // Messages sent during the previous round arrive one round later
        now += ROUND_DURATION;
        for (auto& msg : net.drain()) {
            Validator* target = find_validator(msg.to);
            if (!target) continue;
            switch (msg.kind) {
                case Message::Kind::Request:
                    target->assembler->on_part_request(msg.from, msg.id, msg.index);
                    break;
                case Message::Kind::Part:
                    target->assembler->on_part_received(msg.from, msg.id, msg.part, now);
                    break;
                case Message::Kind::ReceiptProof:
                    target->assembler->on_receipt_proof_received(msg.id, msg.proof);
                    break;
            }
        }

        for (auto& v : validators) v.assembler->on_tick(now);

        bool all_done = true;
        for (const auto& v : validators) all_done = all_done && v.assembler->is_complete(id);
        if (all_done) break;
    }

    int complete = 0;
    for (const auto& v : validators) {
        ChunkStatus s = v.assembler->status(id);
        if (s.kind == ChunkStatus::Kind::Complete) {
            complete++;
            continue;
        }
        std::cout << "[" << v.id << "] Incomplete: " << s.valid_count << " parts held, "
                  << s.missing_count << " missing";
        if (s.kind == ChunkStatus::Kind::Failed) std::cout << " (" << failure_reason_name(s.reason) << ")";
        std::cout << std::endl;
    }

    std::cout << "Finished after " << round << " rounds: " << complete << "/" << validator_count
              << " validators complete, " << net.sent() << " messages sent, " << net.dropped() << " dropped" << std::endl;
    return complete == validator_count ? 0 : 2;
}
