#pragma once

#include <string_view>

// Persisted key names for the account collection. These are on-disk format:
// renaming one orphans existing data.
namespace registrar::schema::key {

inline constexpr std::string_view kUserAccountCollection{
    "TSStorageUserAccountCollection"};

inline constexpr std::string_view kRegisteredNumberKey{
    "TSStorageRegisteredNumberKey"};
inline constexpr std::string_view kRegistrationDateKey{
    "TSAccountManager_RegistrationDateKey"};
inline constexpr std::string_view kRegisteredAciKey{
    "TSStorageRegisteredUUIDKey"};
inline constexpr std::string_view kRegisteredPniKey{
    "TSAccountManager_RegisteredPNIKey"};
inline constexpr std::string_view kIsDeregisteredKey{
    "TSAccountManager_IsDeregisteredKey"};
inline constexpr std::string_view kReregisteringPhoneNumberKey{
    "TSAccountManager_ReregisteringPhoneNumberKey"};
inline constexpr std::string_view kReregisteringAciKey{
    "TSAccountManager_ReregisteringUUIDKey"};
inline constexpr std::string_view kIsOnboardedKey{
    "TSAccountManager_IsOnboardedKey"};
inline constexpr std::string_view kIsTransferInProgressKey{
    "TSAccountManager_IsTransferInProgressKey"};
inline constexpr std::string_view kWasTransferredKey{
    "TSAccountManager_WasTransferredKey"};
inline constexpr std::string_view kIsDiscoverableByPhoneNumberKey{
    "TSAccountManager_IsDiscoverableByPhoneNumber"};
inline constexpr std::string_view kLastSetIsDiscoverableByPhoneNumberKey{
    "TSAccountManager_LastSetIsDiscoverableByPhoneNumberKey"};
inline constexpr std::string_view kServerAuthTokenKey{
    "TSStorageServerAuthToken"};
inline constexpr std::string_view kServerSignalingKey{
    "TSStorageServerSignalingKey"};
inline constexpr std::string_view kManualMessageFetchKey{
    "TSAccountManager_ManualMessageFetchKey"};
inline constexpr std::string_view kDeviceNameKey{"TSAccountManager_DeviceName"};
inline constexpr std::string_view kDeviceIdKey{"TSAccountManager_DeviceId"};

}  // namespace registrar::schema::key
