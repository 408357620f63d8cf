/**
 * test_frame_transport.cpp - Device blocks to fixed frames, and the bounded frame channel
 */

#include "volley/audio/FrameAssembler.hpp"
#include "volley/audio/FrameChannel.hpp"
#include "volley/audio/WavCodec.hpp"
#include "support/Fakes.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace volley::audio;
using volley::testing::makeFrame;

void test_assembler_cuts_fixed_frames() {
    std::vector<AudioFrame> out;
    FrameAssembler assembler(16000, 1, 30, [&out](AudioFrame f) { out.push_back(std::move(f)); });
    assert(assembler.frameSamples() == 480);

    // PortAudio hands over 512-sample blocks
    std::vector<float> block(512, 0.25f);
    for (int i = 0; i < 3; ++i) {
        assembler.push(block.data(), block.size());
    }

    // 1536 samples -> 3 full frames, 96 pending
    assert(out.size() == 3);
    for (size_t i = 0; i < out.size(); ++i) {
        assert(out[i].samples.size() == 480);
        assert(out[i].sequence == i);
        assert(out[i].sample_rate == 16000);
    }
    assert(out[0].samples[0] == floatToPcm16(0.25f));

    assembler.reset();
    std::vector<int16_t> pcm(479, 5);
    assembler.push(pcm.data(), pcm.size());
    assert(out.size() == 3);
    assembler.push(pcm.data(), 1);
    assert(out.size() == 4);
    assert(assembler.framesEmitted() == 4);

    std::cout << "[PASS] test_assembler_cuts_fixed_frames" << std::endl;
}

void test_assembler_stereo() {
    std::vector<AudioFrame> out;
    FrameAssembler assembler(48000, 2, 10, [&out](AudioFrame f) { out.push_back(std::move(f)); });
    assert(assembler.frameSamples() == 960);

    std::vector<int16_t> pcm(960, 1);
    assembler.push(pcm.data(), pcm.size());
    assert(out.size() == 1);
    assert(out[0].channels == 2);
    assert(out[0].sampleCount() == 480);
    assert(out[0].durationMs() == 10);

    std::cout << "[PASS] test_assembler_stereo" << std::endl;
}

void test_channel_drops_oldest_when_full() {
    FrameChannel channel(3);

    for (uint64_t i = 0; i < 5; ++i) {
        assert(channel.push(makeFrame(0, 16000, 30, 1, i)));
    }
    assert(channel.size() == 3);
    assert(channel.dropped() == 2);

    auto first = channel.pop();
    assert(first.has_value());
    assert(first->sequence == 2);

    std::cout << "[PASS] test_channel_drops_oldest_when_full" << std::endl;
}

void test_channel_close_drains_then_ends() {
    FrameChannel channel(8);
    channel.push(makeFrame(1));
    channel.close();

    assert(channel.closed());
    assert(!channel.push(makeFrame(2)));
    assert(channel.pop().has_value());
    assert(!channel.pop().has_value());

    std::cout << "[PASS] test_channel_close_drains_then_ends" << std::endl;
}

void test_channel_pop_for_times_out() {
    FrameChannel channel(8);

    auto start = std::chrono::steady_clock::now();
    auto frame = channel.popFor(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(!frame.has_value());
    assert(elapsed >= std::chrono::milliseconds(40));

    // A blocked consumer is woken by a producer thread
    std::thread producer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push(makeFrame(9, 16000, 30, 1, 77));
    });
    frame = channel.popFor(std::chrono::seconds(2));
    producer.join();
    assert(frame.has_value());
    assert(frame->sequence == 77);

    std::cout << "[PASS] test_channel_pop_for_times_out" << std::endl;
}

int main() {
    std::cout << "=== Frame Transport Tests ===" << std::endl;

    test_assembler_cuts_fixed_frames();
    test_assembler_stereo();
    test_channel_drops_oldest_when_full();
    test_channel_close_drains_then_ends();
    test_channel_pop_for_times_out();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
