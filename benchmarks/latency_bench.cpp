#include "core/types.h"
#include "protocol/wire_codec.h"
#include "utils/channel.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <vector>
using namespace tap;

uint64_t estimate_tsc_freq() {
    auto s = std::chrono::high_resolution_clock::now();
    uint64_t st = rdtsc();
    while (std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - s).count() < 100);
    return (rdtsc() - st) * 1000000000ULL /
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::high_resolution_clock::now() - s).count();
}

struct TSCConv { uint64_t f; double npc; TSCConv(uint64_t f):f(f),npc(1e9/f){} double ns(uint64_t c)const{return c*npc;} };

struct Hist {
    std::vector<double> s; std::string name;
    Hist(std::string n):name(std::move(n)){}
    void add(double v){s.push_back(v);}
    void print()const{
        if(s.empty())return; auto sorted=s; std::sort(sorted.begin(),sorted.end());
        double sum=std::accumulate(sorted.begin(),sorted.end(),0.0);
        size_t n=sorted.size();
        std::cout<<"┌─ "<<name<<" ("<<n<<" samples)\n"
            <<"│  avg:   "<<std::fixed<<std::setprecision(1)<<sum/n<<" ns\n"
            <<"│  p50:   "<<sorted[n*50/100]<<" ns\n"
            <<"│  p99:   "<<sorted[n*99/100]<<" ns\n"
            <<"│  p99.9: "<<sorted[std::min(n-1,n*999/1000)]<<" ns\n"
            <<"│  max:   "<<sorted.back()<<" ns\n"
            <<"└───────────────────────────────────\n\n";
    }
};

// Fetch response payload holding `count` messages of `size` bytes each.
static std::vector<uint8_t> build_payload(int count, uint32_t size) {
    std::vector<uint8_t> out((kLengthFieldSize + kChecksumSize + size) * count);
    uint8_t* p = out.data();
    for (int i = 0; i < count; ++i) {
        store_be32(p, kChecksumSize + size); p += 4;
        store_be32(p, static_cast<uint32_t>(i)); p += 4;
        std::memset(p, 'A' + (i % 26), size); p += size;
    }
    return out;
}

int main(){
    std::cout<<"═══════════════════════════════════════════\n  TapMQ Consumer Latency Benchmark\n═══════════════════════════════════════════\n\n";
    uint64_t f=estimate_tsc_freq(); TSCConv tsc(f);
    std::cout<<"TSC: "<<f/1000000<<" MHz\n\n";

    {Hist h("Fetch request encode"); uint8_t buf[256]; uint64_t off=0;
     for(int i=0;i<10000;++i){(void)protocol::WireEncoder::encode_fetch_request(buf,sizeof(buf),"bench-events",0,off++,1048576);}
     for(int i=0;i<1000000;++i){uint64_t s=rdtsc();(void)protocol::WireEncoder::encode_fetch_request(buf,sizeof(buf),"bench-events",0,off++,1048576);h.add(tsc.ns(rdtsc()-s));}
     h.print();}

    {Hist h("Message decode 1KB"); auto payload=build_payload(1,1024);
     for(int i=0;i<10000;++i){(void)protocol::WireDecoder::decode_message(payload.data(),payload.size());}
     for(int i=0;i<1000000;++i){uint64_t s=rdtsc();auto m=protocol::WireDecoder::decode_message(payload.data(),payload.size());h.add(tsc.ns(rdtsc()-s));if(!m)return 1;}
     h.print();}

    {Hist h("Scan 64 x 1KB response"); auto payload=build_payload(64,1024); uint64_t bytes=0;
     auto sink=[&](const Message& m){bytes+=m.payload_size();return true;};
     for(int i=0;i<1000;++i){(void)protocol::WireDecoder::scan_messages(payload.data(),payload.size(),0,sink);}
     for(int i=0;i<100000;++i){uint64_t s=rdtsc();auto r=protocol::WireDecoder::scan_messages(payload.data(),payload.size(),0,sink);h.add(tsc.ns(rdtsc()-s));if(!r.complete)return 1;}
     h.print(); std::cout<<"  ("<<bytes/(1024*1024)<<" MB scanned)\n\n";}

    {Hist h("Channel push+pop 1KB"); auto payload=build_payload(1,1024); UnboundedChannel<OwnedMessage> ch;
     auto m=protocol::WireDecoder::decode_message(payload.data(),payload.size());
     if(!m)return 1;
     for(int i=0;i<10000;++i){(void)ch.push(m->to_owned());(void)ch.try_pop();}
     for(int i=0;i<1000000;++i){uint64_t s=rdtsc();(void)ch.push(m->at_offset(i).to_owned());(void)ch.try_pop();h.add(tsc.ns(rdtsc()-s));}
     h.print();}

    std::cout<<"═══════════════════════════════════════════\n  Benchmark complete.\n═══════════════════════════════════════════\n";
}
