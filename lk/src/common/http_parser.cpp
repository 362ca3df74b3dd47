/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/http_parser.hpp"
#include "lk/internal/utils.hpp"
#include <strings.h> // strcasecmp

namespace lk::internal {

static std::string url_decode(const std::string& s){
    std::string o; o.reserve(s.size());
    for(std::size_t i=0;i<s.size();++i){
        if(s[i]=='%' && i+2<s.size()){
            int hi=hexval(s[i+1]), lo=hexval(s[i+2]);
            if(hi>=0 && lo>=0){ o.push_back((char)((hi<<4)|lo)); i+=2; continue; }
        }
        if(s[i]=='+'){ o.push_back(' '); continue; }
        o.push_back(s[i]);
    }
    return o;
}

bool parse_request_line(const std::string& line, lk::HttpRequest& r){
    const std::size_t sp1 = line.find(' ');
    if(sp1==std::string::npos || sp1==0) return false;
    const std::size_t sp2 = line.find(' ', sp1+1);
    if(sp2==std::string::npos || sp2==sp1+1) return false;

    r.method  = line.substr(0, sp1);
    std::string target = line.substr(sp1+1, sp2-sp1-1);
    r.httpver = line.substr(sp2+1);
    if(r.httpver.compare(0, 5, "HTTP/")!=0) return false;

    const std::size_t qm = target.find('?');
    if(qm==std::string::npos){
        r.path = target;
        r.query.clear();
    } else {
        r.path = target.substr(0, qm);
        r.query = target.substr(qm+1);
    }
    return !r.path.empty() && r.path[0]=='/';
}

QueryMap parse_query(const std::string& q){
    QueryMap m; std::size_t p=0;
    while(p<q.size()){
        std::size_t amp=q.find('&',p);
        if(amp==std::string::npos) amp=q.size();
        const std::string pair=q.substr(p, amp-p);
        if(!pair.empty()){
            const std::size_t eq=pair.find('=');
            if(eq==std::string::npos) m[url_decode(pair)]=std::string();
            else m[url_decode(pair.substr(0,eq))]=url_decode(pair.substr(eq+1));
        }
        p=amp+1;
    }
    return m;
}

std::string query_ci(const QueryMap& q, const char* name, bool* found){
    if(found) *found=false;
    auto it = q.find(name);
    if(it == q.end()){
        for(auto kv = q.begin(); kv != q.end(); ++kv){
            if(strcasecmp(kv->first.c_str(), name)==0){ it = kv; break; }
        }
    }
    if(it == q.end()) return {};
    if(found) *found=true;
    return it->second;
}

std::string hdr_ci(const lk::HttpRequest& R, const char* name){
    auto it = R.headers.find(name);
    if (it != R.headers.end()) return it->second;
    for (const auto& kv : R.headers){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

} // namespace lk::internal
