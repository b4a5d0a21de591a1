#pragma once

#include <arpa/nameser.h>
#include <gmock/gmock.h>
#include <resolv.h>

// Replaces the libresolv calls behind SRV lookups for the whole test binary. Only one translation unit may include
// this header. Lookups made while no mock is active fail like an unreachable name server.
struct ResolverMock {
	MOCK_METHOD(int, res_query, (const char* dname, int class_, int type, unsigned char* answer, int anslen));
	MOCK_METHOD(int, ns_initparse, (const unsigned char* msg, int msglen, ns_msg* handle));
	MOCK_METHOD(int, ns_parserr, (ns_msg * handle, ns_sect section, int rrnum, ns_rr* rr));
};

static ResolverMock* active_resolver_mock = nullptr;

extern "C" int res_query(const char* dname, int class_, int type, unsigned char* answer, int anslen) __THROW {
	if (active_resolver_mock == nullptr) {
		return -1;
	}
	return active_resolver_mock->res_query(dname, class_, type, answer, anslen);
}
extern "C" int ns_initparse(const unsigned char* msg, int msglen, ns_msg* handle) __THROW {
	if (active_resolver_mock == nullptr) {
		return -1;
	}
	return active_resolver_mock->ns_initparse(msg, msglen, handle);
}
extern "C" int ns_parserr(ns_msg* handle, ns_sect section, int rrnum, ns_rr* rr) __THROW {
	if (active_resolver_mock == nullptr) {
		return -1;
	}
	return active_resolver_mock->ns_parserr(handle, section, rrnum, rr);
}
