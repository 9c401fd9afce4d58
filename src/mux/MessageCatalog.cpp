#include "MessageCatalog.hpp"

namespace mrm {
void MessageCatalog::registerType(uint32_t tag, const string& typeName,
                                  PayloadDecoder decoder,
                                  PayloadEncoder encoder) {
  auto it = entries.find(tag);
  if (it != entries.end()) {
    throw std::runtime_error(string("Tag ") + to_string(tag) +
                             " is already registered to " +
                             it->second.typeName);
  }
  CatalogEntry entry;
  entry.tag = tag;
  entry.typeName = typeName;
  entry.decode = decoder;
  entry.encode = encoder;
  entries.insert(make_pair(tag, entry));
  VLOG(2) << "Registered tag " << tag << " as " << typeName;
}

const CatalogEntry* MessageCatalog::find(uint32_t tag) const {
  auto it = entries.find(tag);
  if (it == entries.end()) {
    return NULL;
  }
  return &(it->second);
}

string MessageCatalog::describe(uint32_t tag) const {
  const CatalogEntry* entry = find(tag);
  if (entry == NULL) {
    return string("opaque(") + to_string(tag) + ")";
  }
  return entry->typeName + "(" + to_string(tag) + ")";
}

shared_ptr<MessageCatalog> MessageCatalog::createDefault() {
  shared_ptr<MessageCatalog> catalog(new MessageCatalog());
  catalog->registerProto<SendCommandMessage>(SEND_COMMAND_MESSAGE);
  catalog->registerProto<SendCommandResultMessage>(
      SEND_COMMAND_RESULT_MESSAGE);
  catalog->registerProto<SetStateMessage>(SET_STATE_MESSAGE);
  catalog->registerProto<SetArtworkMessage>(SET_ARTWORK_MESSAGE);
  catalog->registerProto<DeviceInfoMessage>(DEVICE_INFO_MESSAGE);
  catalog->registerProto<ClientUpdatesConfigMessage>(
      CLIENT_UPDATES_CONFIG_MESSAGE);
  catalog->registerProto<KeyboardMessage>(KEYBOARD_MESSAGE);
  catalog->registerProto<TransactionMessage>(TRANSACTION_MESSAGE);
  catalog->registerProto<TransactionCancelMessage>(TRANSACTION_CANCEL_MESSAGE);
  catalog->registerProto<GenericMessage>(GENERIC_MESSAGE);
  catalog->registerProto<ModifyOutputContextRequestMessage>(
      MODIFY_OUTPUT_CONTEXT_REQUEST_MESSAGE);
  catalog->registerProto<SetVolumeMessage>(SET_VOLUME_MESSAGE);
  catalog->registerProto<VolumeDidChangeMessage>(VOLUME_DID_CHANGE_MESSAGE);
  catalog->registerProto<UpdateOutputDeviceMessage>(
      UPDATE_OUTPUT_DEVICE_MESSAGE);
  return catalog;
}
}  // namespace mrm
